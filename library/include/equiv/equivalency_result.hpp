#ifndef equivalency_result_hpp
#define equivalency_result_hpp

#include <ostream>

namespace equiv {

/// @brief Outcome of an equivalency step for a node.
enum class equivalency_result {
    /// @brief Step doesn't apply, the next step is to be tried.
    continue_with_next,

    /// @brief Step determined the node's comparands to be equivalent.
    equivalency_proven,

    /// @brief Step determined the node's comparands not to be equivalent
    ///   and has already recorded the failure.
    assertion_failed,
};

/// @brief Whether the given result ends the evaluation of a node.
constexpr auto is_terminal(equivalency_result value) noexcept -> bool
{
    return value != equivalency_result::continue_with_next;
}

auto operator<<(std::ostream& os, equivalency_result value) -> std::ostream&;

}

#endif /* equivalency_result_hpp */
