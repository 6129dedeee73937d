#include <algorithm> // for std::min
#include <cctype> // for std::isspace, std::tolower

#include "equiv/string_assertions.hpp"
#include "equiv/value.hpp"

namespace equiv {

namespace {

constexpr auto excerpt_length = std::size_t{3};

auto is_space(char c) -> bool
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto fold(char c) -> char
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

auto same_char(char a, char b, bool ignore_case) -> bool
{
    return ignore_case? (fold(a) == fold(b)): (a == b);
}

/// @brief Index of the first difference, or the shorter length if one
///   string is a prefix of the other.
auto mismatch_index(std::string_view a, std::string_view b,
                    bool ignore_case) -> std::size_t
{
    const auto n = std::min(size(a), size(b));
    auto i = std::size_t{0};
    while ((i < n) && same_char(a[i], b[i], ignore_case)) {
        ++i;
    }
    return i;
}

auto quoted(std::string_view text) -> std::string
{
    return to_string(value{text});
}

}

auto normalize(std::string_view text, const string_options& options)
    -> std::string
{
    if (options.ignore_leading_whitespace()) {
        while (!empty(text) && is_space(text.front())) {
            text.remove_prefix(1);
        }
    }
    if (options.ignore_trailing_whitespace()) {
        while (!empty(text) && is_space(text.back())) {
            text.remove_suffix(1);
        }
    }
    auto result = std::string{};
    result.reserve(size(text));
    for (auto i = std::size_t{0}; i < size(text); ++i) {
        const auto c = text[i];
        if (options.ignore_newline_style() && (c == '\r')) {
            result += '\n';
            if ((i + 1u < size(text)) && (text[i + 1u] == '\n')) {
                ++i;
            }
            continue;
        }
        result += c;
    }
    return result;
}

auto be_equivalent_string(assertion_chain& chain,
                          std::string_view subject,
                          std::string_view expectation,
                          const string_options& options) -> bool
{
    chain.begin_assertion();
    const auto actual = normalize(subject, options);
    const auto expected = normalize(expectation, options);
    const auto index = mismatch_index(actual, expected, options.ignore_case());
    if ((index == size(actual)) && (size(actual) == size(expected))) {
        return true;
    }
    const auto start = (index < size(actual))
        ? index
        : (empty(actual)? std::size_t{0}: size(actual) - 1u);
    const auto near = quoted(std::string_view{actual}.substr(start,
                                                             excerpt_length));
    if (size(actual) != size(expected)) {
        chain.fail_with("Expected {context} to be {0} with a length of {1}"
                        "{reason}, but {2} has a length of {3}, differs near "
                        "{4} (index {5}).", {
                            quoted(expected),
                            std::to_string(size(expected)),
                            quoted(actual),
                            std::to_string(size(actual)),
                            near,
                            std::to_string(start),
                        });
        return false;
    }
    chain.fail_with("Expected {context} to be {0}{reason}, but {1} differs "
                    "near {2} (index {3}).", {
                        quoted(expected),
                        quoted(actual),
                        near,
                        std::to_string(start),
                    });
    return false;
}

}
