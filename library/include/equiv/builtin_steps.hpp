#ifndef builtin_steps_hpp
#define builtin_steps_hpp

#include <stdexcept> // for std::logic_error

#include "equiv/child_validator.hpp"
#include "equiv/comparands.hpp"
#include "equiv/equivalency_context.hpp"
#include "equiv/equivalency_result.hpp"
#include "equiv/equivalency_step.hpp"

namespace equiv {

/// @brief Thrown when an object expectation has no members to compare.
struct no_members_selected: std::logic_error
{
    using std::logic_error::logic_error;
};

}

namespace equiv::steps {

constexpr auto reference_equality_name = "reference_equality";
constexpr auto sequence_equivalency_name = "sequence_equivalency";
constexpr auto string_equality_name = "string_equality";
constexpr auto structural_equality_name = "structural_equality";
constexpr auto simple_equality_name = "simple_equality";

/// @brief Proves nodes whose sides are the same object or sequence, or
///   are both absent.
auto reference_equality(const comparands& values,
                        equivalency_context& context,
                        child_validator& children) -> equivalency_result;

/// @brief Compares nodes whose expectation is a sequence, item by item.
/// @note Items are matched in order with strict ordering. Otherwise each
///   expected item must be equivalent to a distinct subject item.
auto sequence_equivalency(const comparands& values,
                          equivalency_context& context,
                          child_validator& children) -> equivalency_result;

/// @brief Compares nodes whose expected type is exactly the string type.
/// @details Absent or non-string subjects are failures. Strings are
///   compared by <code>be_equivalent_string</code> on the current chain,
///   using the string refinement of the options if there is one or else
///   string options made from the generic flags of the options.
/// @throws std::invalid_argument if the expectation is present but isn't
///   a string.
auto string_equality(const comparands& values,
                     equivalency_context& context,
                     child_validator& children) -> equivalency_result;

/// @brief Compares nodes whose expectation is an object, member by member.
/// @throws no_members_selected if the expectation has no members left to
///   compare after exclusions.
auto structural_equality(const comparands& values,
                         equivalency_context& context,
                         child_validator& children) -> equivalency_result;

/// @brief Compares scalar nodes by value.
/// @note Applies to any node so it belongs at the end of a step list.
auto simple_equality(const comparands& values,
                     equivalency_context& context,
                     child_validator& children) -> equivalency_result;

}

namespace equiv {

/// @brief Gets the string options to compare strings with.
/// @return The string refinement of the given options if there is one,
///   otherwise string options having the generic flags of the options.
auto make_string_options(const equivalency_options& options)
    -> string_options;

/// @brief Gets the built-in steps in the order they're to be evaluated.
auto default_steps() -> step_list;

}

#endif /* builtin_steps_hpp */
