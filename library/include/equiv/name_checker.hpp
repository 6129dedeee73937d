#ifndef name_checker_hpp
#define name_checker_hpp

#include <cstddef> // for std::size_t
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>

namespace equiv {

/// @brief Thrown for a member path, member name or type name that isn't
///   made up of valid names.
struct invalid_name: std::invalid_argument
{
    /// @param[in] text The path or name that failed validation.
    /// @param[in] position Index within @text of the first offending
    ///   character, or of the empty component.
    /// @param[in] what_arg Explanatory message.
    invalid_name(std::string text, std::size_t position,
                 const std::string& what_arg);

    [[nodiscard]] auto text() const noexcept -> const std::string&;
    [[nodiscard]] auto position() const noexcept -> std::size_t;

private:
    std::string text_;
    std::size_t position_{};
};

}

namespace equiv::detail {

/// @brief Characters names may have.
constexpr auto name_charset = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "_"
};

/// @brief Validates the given text as a path of names.
/// @param[in] text Path to validate, like <code>Address.City</code>.
/// @param[in] separator Character separating the names of the path.
/// @param[in] kind What the text is, like <code>member path</code>, for
///   the message of the exception.
/// @throws invalid_name if @text has an empty name or a character that's
///   neither in the name charset nor the separator.
auto validate_path(std::string_view text, char separator,
                   std::string_view kind) -> void;

/// @brief Validates the given text as a single name.
/// @note Empty text is valid, being the value of a default name.
/// @throws invalid_name if @text has a character outside of the name
///   charset.
auto validate_name(std::string text, std::string_view kind) -> std::string;

}

#endif /* name_checker_hpp */
