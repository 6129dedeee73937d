#ifndef string_options_hpp
#define string_options_hpp

#include <ostream>

namespace equiv {

/// @brief Options for comparing strings.
/// @note Values of this type are never modified. The fluent members make
///   new values instead.
struct string_options
{
    [[nodiscard]] auto ignoring_case() const -> string_options;
    [[nodiscard]] auto ignoring_leading_whitespace() const -> string_options;
    [[nodiscard]] auto ignoring_trailing_whitespace() const -> string_options;
    [[nodiscard]] auto ignoring_newline_style() const -> string_options;

    [[nodiscard]] auto ignore_case() const noexcept -> bool;
    [[nodiscard]] auto ignore_leading_whitespace() const noexcept -> bool;
    [[nodiscard]] auto ignore_trailing_whitespace() const noexcept -> bool;
    [[nodiscard]] auto ignore_newline_style() const noexcept -> bool;

    auto operator==(const string_options&) const -> bool = default;

private:
    bool ignore_case_{};
    bool ignore_leading_whitespace_{};
    bool ignore_trailing_whitespace_{};
    bool ignore_newline_style_{};
};

auto operator<<(std::ostream& os, const string_options& value)
    -> std::ostream&;

}

#endif /* string_options_hpp */
