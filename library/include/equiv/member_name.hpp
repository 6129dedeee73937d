#ifndef member_name_hpp
#define member_name_hpp

#include <concepts> // for std::regular.
#include <ostream>
#include <string>
#include <string_view>
#include <utility> // for std::move
#include <vector>

#include "equiv/checked.hpp"
#include "equiv/name_checker.hpp"
#include "equiv/reserved.hpp"

namespace equiv {

/// @brief Checker of member names for <code>detail::checked</code>.
struct member_name_checker
{
    auto operator()() const -> std::string
    {
        return {};
    }

    auto operator()(std::string v) const -> std::string
    {
        return detail::validate_name(std::move(v), "member name");
    }
};

/// @brief Member name.
/// @details A lexical token identifying a member of an <code>object</code>.
/// @note This is a strongly typed <code>std::string</code> that can be
///   constructed from strings containing only characters from its allowed
///   character set. An <code>invalid_name</code> exception is thrown
///   otherwise.
using member_name = detail::checked<std::string, member_name_checker>;

static_assert(std::regular<member_name>);

/// @brief Splits the given member path by the specified separator.
/// @note Empty input gives an empty result.
/// @throws invalid_name naming the whole path if any component is an
///   invalid <code>member_name</code> (including an empty component).
auto to_member_names(std::string_view string,
                     char separator = reserved::member_separator)
    -> std::vector<member_name>;

/// @brief Joins the given names with the member separator.
auto to_member_path(const std::vector<member_name>& names) -> std::string;

}

#endif /* member_name_hpp */
