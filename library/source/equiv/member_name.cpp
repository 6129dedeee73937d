#include "equiv/member_name.hpp"

namespace equiv {

auto to_member_names(std::string_view string, char separator)
    -> std::vector<member_name>
{
    auto result = std::vector<member_name>{};
    if (empty(string)) {
        return result;
    }
    detail::validate_path(string, separator, "member path");
    auto pos = decltype(string.find(separator)){};
    while ((pos = string.find(separator)) != std::string_view::npos) {
        result.emplace_back(std::string{string.substr(0, pos)});
        string.remove_prefix(pos + 1);
    }
    result.emplace_back(std::string{string});
    return result;
}

auto to_member_path(const std::vector<member_name>& names) -> std::string
{
    auto result = std::string{};
    for (auto&& name: names) {
        if (!empty(result)) {
            result += reserved::member_separator;
        }
        result += name.get();
    }
    return result;
}

}
