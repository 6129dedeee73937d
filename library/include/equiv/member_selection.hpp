#ifndef member_selection_hpp
#define member_selection_hpp

#include <vector>

#include "equiv/equivalency_options.hpp"
#include "equiv/node.hpp"
#include "equiv/value.hpp"

namespace equiv {

/// @brief Gets the members of the given object to compare.
/// @param[in] parent Node of the given object.
/// @param[in] expectation Object whose members are to be compared.
/// @param[in] options Options whose exclusions apply.
/// @return Pointers to the object's members that aren't excluded, in the
///   order the object has them.
auto select_members(const node& parent,
                    const object& expectation,
                    const equivalency_options& options)
    -> std::vector<const member*>;

}

#endif /* member_selection_hpp */
