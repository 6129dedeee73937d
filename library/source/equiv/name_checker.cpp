#include <cctype> // for std::isprint
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "equiv/name_checker.hpp"

namespace equiv {

invalid_name::invalid_name(std::string text, std::size_t position,
                           const std::string& what_arg):
    std::invalid_argument{what_arg},
    text_{std::move(text)},
    position_{position}
{
    // Intentionally empty.
}

auto invalid_name::text() const noexcept -> const std::string&
{
    return text_;
}

auto invalid_name::position() const noexcept -> std::size_t
{
    return position_;
}

}

namespace equiv::detail {

namespace {

auto write_char(std::ostream& os, char c) -> void
{
    if (std::isprint(static_cast<unsigned char>(c))) {
        os << '\'' << c << '\'';
        return;
    }
    os << "character code " << int(static_cast<unsigned char>(c));
}

[[noreturn]] auto throw_bad_char(std::string_view text, std::size_t position,
                                 std::string_view kind) -> void
{
    std::ostringstream os;
    os << kind << " \"" << text << "\" may not contain ";
    write_char(os, text[position]);
    os << " (index " << position << ")";
    throw invalid_name{std::string{text}, position, os.str()};
}

[[noreturn]] auto throw_empty_name(std::string_view text,
                                   std::size_t position,
                                   std::string_view kind) -> void
{
    std::ostringstream os;
    os << kind << " \"" << text << "\" has an empty name";
    os << " (index " << position << ")";
    throw invalid_name{std::string{text}, position, os.str()};
}

}

auto validate_path(std::string_view text, char separator,
                   std::string_view kind) -> void
{
    auto name_start = std::size_t{0};
    for (auto i = std::size_t{0}; i <= size(text); ++i) {
        if ((i == size(text)) || (text[i] == separator)) {
            if (i == name_start) {
                throw_empty_name(text, i, kind);
            }
            name_start = i + 1u;
            continue;
        }
        if (name_charset.find(text[i]) == std::string_view::npos) {
            throw_bad_char(text, i, kind);
        }
    }
}

auto validate_name(std::string text, std::string_view kind) -> std::string
{
    const auto found = text.find_first_not_of(name_charset);
    if (found != std::string::npos) {
        throw_bad_char(text, found, kind);
    }
    return text;
}

}
