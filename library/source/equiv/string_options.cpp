#include "equiv/string_options.hpp"

namespace equiv {

auto string_options::ignoring_case() const -> string_options
{
    auto result = *this;
    result.ignore_case_ = true;
    return result;
}

auto string_options::ignoring_leading_whitespace() const -> string_options
{
    auto result = *this;
    result.ignore_leading_whitespace_ = true;
    return result;
}

auto string_options::ignoring_trailing_whitespace() const -> string_options
{
    auto result = *this;
    result.ignore_trailing_whitespace_ = true;
    return result;
}

auto string_options::ignoring_newline_style() const -> string_options
{
    auto result = *this;
    result.ignore_newline_style_ = true;
    return result;
}

auto string_options::ignore_case() const noexcept -> bool
{
    return ignore_case_;
}

auto string_options::ignore_leading_whitespace() const noexcept -> bool
{
    return ignore_leading_whitespace_;
}

auto string_options::ignore_trailing_whitespace() const noexcept -> bool
{
    return ignore_trailing_whitespace_;
}

auto string_options::ignore_newline_style() const noexcept -> bool
{
    return ignore_newline_style_;
}

auto operator<<(std::ostream& os, const string_options& value)
    -> std::ostream&
{
    os << "string_options{";
    auto prefix = "";
    if (value.ignore_case()) {
        os << prefix << "ignore_case";
        prefix = ",";
    }
    if (value.ignore_leading_whitespace()) {
        os << prefix << "ignore_leading_whitespace";
        prefix = ",";
    }
    if (value.ignore_trailing_whitespace()) {
        os << prefix << "ignore_trailing_whitespace";
        prefix = ",";
    }
    if (value.ignore_newline_style()) {
        os << prefix << "ignore_newline_style";
    }
    os << "}";
    return os;
}

}
