#ifndef assertion_chain_hpp
#define assertion_chain_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "equiv/message_format.hpp"
#include "equiv/reserved.hpp"

namespace equiv {

/// @brief Failure aggregating sink of one logical check.
/// @details Failures are recorded, not thrown, so that failures from
///   independent branches of a comparison can all be collected before the
///   caller inspects the outcome.
/// @note A chain is meant to be used by one check at a time. Concurrently
///   running checks each need their own chain.
struct assertion_chain
{
    explicit assertion_chain(std::string subject = reserved::root_name);

    /// @brief Sets the condition the next <code>fail_with</code> is subject to.
    /// @note A true condition makes the next <code>fail_with</code> a no-op.
    auto for_condition(bool condition) -> assertion_chain&;

    /// @brief Sets the reason substituted for <code>{reason}</code>.
    /// @throws fmt::format_error if the reason's message is malformed.
    auto because_of(const reason& because) -> assertion_chain&;

    /// @brief Sets the description substituted for <code>{context}</code>.
    auto with_subject(std::string description) -> assertion_chain&;

    /// @brief Records a failure unless the pending condition holds.
    /// @note Consumes the pending condition.
    /// @throws fmt::format_error if @message_template is malformed.
    /// @see format_message.
    auto fail_with(std::string_view message_template,
                   const std::vector<std::string>& args = {})
        -> assertion_chain&;

    /// @brief Opens a new logical assertion, unless the reuse flag is set in
    ///   which case the flag is consumed and the current assertion continues.
    auto begin_assertion() -> assertion_chain&;

    /// @brief Makes the next <code>begin_assertion</code> continue the
    ///   current logical assertion instead of opening a new one.
    auto reuse_once() noexcept -> void;

    /// @brief Takes the reuse flag.
    /// @return Whether the flag had been set. The flag is cleared either way.
    auto consume_reuse() noexcept -> bool;

    /// @brief Whether no failure has been recorded.
    [[nodiscard]] auto succeeded() const noexcept -> bool;

    [[nodiscard]] auto failures() const noexcept
        -> const std::vector<std::string>&;
    [[nodiscard]] auto assertion_count() const noexcept -> std::size_t;
    [[nodiscard]] auto get_reason() const noexcept -> const reason&;
    [[nodiscard]] auto subject() const noexcept -> const std::string&;

private:
    std::string subject_;
    reason reason_;
    std::string formatted_reason_;
    std::vector<std::string> failures_;
    std::optional<bool> condition_;
    std::size_t assertions_{};
    bool reuse_{};
};

}

#endif /* assertion_chain_hpp */
