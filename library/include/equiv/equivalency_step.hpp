#ifndef equivalency_step_hpp
#define equivalency_step_hpp

#include <functional> // for std::function
#include <string>
#include <string_view>
#include <vector>

#include "equiv/equivalency_result.hpp"

namespace equiv {

struct child_validator;
struct comparands;
struct equivalency_context;

using step_handler = std::function<
    equivalency_result(const comparands&, equivalency_context&,
                       child_validator&)
>;

/// @brief Unit of extensibility of the equivalency pipeline.
/// @details A named strategy deciding the equivalency of the comparands of
///   nodes it applies to. Steps that don't apply must return
///   <code>equivalency_result::continue_with_next</code> without any side
///   effects.
struct equivalency_step
{
    std::string name;
    step_handler handle;
};

using step_list = std::vector<equivalency_step>;

/// @brief Inserts the given step before the first step having the given
///   name, or at the end if there's no such step.
auto insert_before(step_list& steps, std::string_view name,
                   equivalency_step step) -> void;

/// @brief Finds the first step having the given name.
auto find_step(const step_list& steps, std::string_view name)
    -> const equivalency_step*;

}

#endif /* equivalency_step_hpp */
