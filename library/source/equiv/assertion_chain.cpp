#include <utility> // for std::exchange

#include "equiv/assertion_chain.hpp"
#include "equiv/logging.hpp"

namespace equiv {

assertion_chain::assertion_chain(std::string subject):
    subject_{std::move(subject)}
{
    // Intentionally empty.
}

auto assertion_chain::for_condition(bool condition) -> assertion_chain&
{
    condition_ = condition;
    return *this;
}

auto assertion_chain::because_of(const reason& because) -> assertion_chain&
{
    formatted_reason_ = format_reason(because);
    reason_ = because;
    return *this;
}

auto assertion_chain::with_subject(std::string description)
    -> assertion_chain&
{
    subject_ = std::move(description);
    return *this;
}

auto assertion_chain::fail_with(std::string_view message_template,
                                const std::vector<std::string>& args)
    -> assertion_chain&
{
    if (std::exchange(condition_, std::nullopt).value_or(false)) {
        return *this;
    }
    failures_.push_back(format_message(message_template, args,
                                       formatted_reason_, subject_));
    EQUIV_LOG_DEBUG("recorded failure: {}", failures_.back());
    return *this;
}

auto assertion_chain::begin_assertion() -> assertion_chain&
{
    if (!consume_reuse()) {
        ++assertions_;
    }
    return *this;
}

auto assertion_chain::reuse_once() noexcept -> void
{
    reuse_ = true;
}

auto assertion_chain::consume_reuse() noexcept -> bool
{
    return std::exchange(reuse_, false);
}

auto assertion_chain::succeeded() const noexcept -> bool
{
    return empty(failures_);
}

auto assertion_chain::failures() const noexcept
    -> const std::vector<std::string>&
{
    return failures_;
}

auto assertion_chain::assertion_count() const noexcept -> std::size_t
{
    return assertions_;
}

auto assertion_chain::get_reason() const noexcept -> const reason&
{
    return reason_;
}

auto assertion_chain::subject() const noexcept -> const std::string&
{
    return subject_;
}

}
