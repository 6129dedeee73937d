#ifndef equivalency_hpp
#define equivalency_hpp

#include <optional>
#include <ostream>
#include <stdexcept> // for std::runtime_error

#include "equiv/assertion_chain.hpp"
#include "equiv/default_options.hpp"
#include "equiv/equivalency_options.hpp"
#include "equiv/message_format.hpp"
#include "equiv/type_id.hpp"
#include "equiv/value.hpp"

namespace equiv {

/// @brief Thrown by <code>assert_equivalent</code> for values that aren't
///   equivalent.
/// @note The message lists every failure found.
struct assertion_failed: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// @brief Checks whether the given subject is equivalent to the given
///   expectation.
/// @param[in] subject Value being checked.
/// @param[in] expectation Value the subject is expected to be equivalent to.
/// @param[in] options Options to judge equivalency by.
/// @param[in] because Reason substituted in failure messages.
/// @param[in] declared_type Declared type of both values, if known.
/// @return The chain having every failure found, if any.
/// @throws no_applicable_step if no step claims some node.
/// @throws no_members_selected if some object has nothing to compare.
auto check_equivalence(const value& subject,
                       const value& expectation,
                       const equivalency_options& options,
                       const reason& because = {},
                       const std::optional<type_id>& declared_type = {})
    -> assertion_chain;

/// @brief Checks equivalency using the default options.
/// @see default_options.
auto check_equivalence(const value& subject,
                       const value& expectation,
                       const reason& because = {},
                       const std::optional<type_id>& declared_type = {})
    -> assertion_chain;

/// @brief Checks equivalency using what the given function makes of the
///   default options.
auto check_equivalence(const value& subject,
                       const value& expectation,
                       const options_configurer& configure,
                       const reason& because = {},
                       const std::optional<type_id>& declared_type = {})
    -> assertion_chain;

/// @brief Asserts that the given subject is equivalent to the given
///   expectation.
/// @throws assertion_failed if it isn't.
auto assert_equivalent(const value& subject,
                       const value& expectation,
                       const equivalency_options& options,
                       const reason& because = {},
                       const std::optional<type_id>& declared_type = {})
    -> void;

auto assert_equivalent(const value& subject,
                       const value& expectation,
                       const reason& because = {},
                       const std::optional<type_id>& declared_type = {})
    -> void;

/// @brief Writes a summary of the given chain's outcome.
/// @note Each failure is written on its own lines, indented.
auto report(std::ostream& os, const assertion_chain& chain) -> void;

}

#endif /* equivalency_hpp */
