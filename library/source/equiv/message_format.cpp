#include <cctype> // for std::isspace

#include <fmt/args.h>
#include <fmt/format.h>

#include "equiv/message_format.hpp"

namespace equiv {

namespace {

constexpr auto because_word = std::string_view{"because"};

auto trim(std::string_view text) -> std::string_view
{
    while (!empty(text) &&
           std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!empty(text) &&
           std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto starts_with_because(std::string_view text) -> bool
{
    if (size(text) < size(because_word)) {
        return false;
    }
    for (auto i = std::size_t{0}; i < size(because_word); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (std::tolower(c) != because_word[i]) {
            return false;
        }
    }
    return true;
}

auto make_store(const std::vector<std::string>& args)
    -> fmt::dynamic_format_arg_store<fmt::format_context>
{
    auto store = fmt::dynamic_format_arg_store<fmt::format_context>{};
    store.reserve(size(args) + 2u, 2u);
    for (auto&& arg: args) {
        store.push_back(arg);
    }
    return store;
}

}

auto format_reason(const reason& because) -> std::string
{
    const auto trimmed = trim(because.message);
    if (empty(trimmed)) {
        return {};
    }
    const auto store = make_store(because.arguments);
    auto text = empty(because.arguments)
        ? std::string{trimmed}
        : fmt::vformat(fmt::string_view{trimmed.data(), trimmed.size()},
                       store);
    if (!starts_with_because(text)) {
        text = std::string{because_word} + " " + text;
    }
    return " " + text;
}

auto escape_placeholders(std::string_view text) -> std::string
{
    auto result = std::string{};
    result.reserve(size(text));
    for (auto&& c: text) {
        result += c;
        if ((c == '{') || (c == '}')) {
            result += c;
        }
    }
    return result;
}

auto format_message(std::string_view message_template,
                    const std::vector<std::string>& args,
                    const std::string& formatted_reason,
                    const std::string& context) -> std::string
{
    auto store = make_store(args);
    store.push_back(fmt::arg("reason", formatted_reason));
    store.push_back(fmt::arg("context", context));
    return fmt::vformat(fmt::string_view{message_template.data(),
                                         message_template.size()},
                        store);
}

}
