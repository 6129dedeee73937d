#ifndef child_validator_hpp
#define child_validator_hpp

#include "equiv/comparands.hpp"
#include "equiv/equivalency_options.hpp"
#include "equiv/node.hpp"

namespace equiv {

/// @brief Recursion interface given to steps.
/// @details Lets steps for composite values have the members or items of
///   those values validated without having to know how recursion, depth
///   limiting, or cycle detection is done.
struct child_validator
{
    virtual ~child_validator() = default;

    /// @brief Validates the given child comparands.
    /// @note Failures are recorded on the chain of the current check.
    virtual auto validate(const comparands& child,
                          const node& child_node,
                          const equivalency_options& child_options)
        -> void = 0;

    /// @brief Validates the given child comparands on a fresh chain.
    /// @note Nothing is recorded on the chain of the current check.
    /// @return Whether the child comparands were found equivalent.
    virtual auto try_validate(const comparands& child,
                              const node& child_node,
                              const equivalency_options& child_options)
        -> bool = 0;
};

}

#endif /* child_validator_hpp */
