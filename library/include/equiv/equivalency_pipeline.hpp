#ifndef equivalency_pipeline_hpp
#define equivalency_pipeline_hpp

#include <stdexcept> // for std::logic_error
#include <utility> // for std::pair
#include <vector>

#include "equiv/assertion_chain.hpp"
#include "equiv/child_validator.hpp"
#include "equiv/equivalency_step.hpp"

namespace equiv {

/// @brief Thrown when none of the steps claims a node.
struct no_applicable_step: std::logic_error
{
    using std::logic_error::logic_error;
};

/// @brief Evaluates nodes by trying each of its steps in order until one
///   of them gives a terminal result.
/// @details Recursion into child nodes is limited by the options' maximum
///   recursion depth. Objects and sequences revisited on the current path
///   are treated as equivalent, or as failures, depending on the options'
///   cyclic reference handling.
/// @note One pipeline is meant for one check. It's neither copyable nor
///   safe to use from more than one thread at a time.
struct equivalency_pipeline final: child_validator
{
    using identity_pair = std::pair<const void*, const void*>;

    equivalency_pipeline(step_list steps, assertion_chain& chain);

    equivalency_pipeline(const equivalency_pipeline&) = delete;
    auto operator=(const equivalency_pipeline&)
        -> equivalency_pipeline& = delete;

    /// @brief Evaluates the given comparands at the given node.
    /// @throws no_applicable_step if no step claims the node or any node
    ///   evaluated through it.
    auto evaluate(const comparands& values,
                  const node& at,
                  const equivalency_options& options) -> void;

    auto validate(const comparands& child,
                  const node& child_node,
                  const equivalency_options& child_options)
        -> void override;

    auto try_validate(const comparands& child,
                      const node& child_node,
                      const equivalency_options& child_options)
        -> bool override;

    [[nodiscard]] auto steps() const noexcept -> const step_list&;

    /// @brief Identity pairs being visited on the current path.
    [[nodiscard]] auto visiting() const noexcept
        -> const std::vector<identity_pair>&;

private:
    step_list steps_;
    assertion_chain* chain_;
    std::vector<identity_pair> visiting_;
};

/// @brief Makes the steps for the given options.
/// @return The options' custom steps followed by the default steps.
auto make_steps(const equivalency_options& options) -> step_list;

}

#endif /* equivalency_pipeline_hpp */
