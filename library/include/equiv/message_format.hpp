#ifndef message_format_hpp
#define message_format_hpp

#include <string>
#include <string_view>
#include <vector>

namespace equiv {

/// @brief The "because" clause of an assertion.
/// @details The message may itself contain positional placeholders like
///   <code>{0}</code> that are substituted by the arguments.
struct reason
{
    std::string message;
    std::vector<std::string> arguments;
};

inline auto operator==(const reason& lhs, const reason& rhs) -> bool
{
    return (lhs.message == rhs.message) && (lhs.arguments == rhs.arguments);
}

/// @brief Formats the given reason for substitution of the
///   <code>{reason}</code> placeholder.
/// @return Empty string for an empty reason. Otherwise the trimmed reason
///   preceded by a space and by <code>because</code> if it didn't already
///   start with that word.
/// @throws fmt::format_error if the reason's message is malformed.
auto format_reason(const reason& because) -> std::string;

/// @brief Doubles the braces in the given text.
/// @note Use this for any dynamically sourced text that becomes part of a
///   message template so its braces aren't taken as placeholders.
auto escape_placeholders(std::string_view text) -> std::string;

/// @brief Renders a message template.
/// @param[in] message_template Template having positional placeholders like
///   <code>{0}</code> and optionally the named placeholders
///   <code>{reason}</code> and <code>{context}</code>.
/// @param[in] args Positional arguments, already in display form.
/// @param[in] formatted_reason Text for the <code>{reason}</code>
///   placeholder.
/// @param[in] context Text for the <code>{context}</code> placeholder.
/// @throws fmt::format_error if the template is malformed or refers to an
///   argument that isn't given.
auto format_message(std::string_view message_template,
                    const std::vector<std::string>& args,
                    const std::string& formatted_reason = {},
                    const std::string& context = {}) -> std::string;

}

#endif /* message_format_hpp */
