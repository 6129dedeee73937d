#include <algorithm> // for std::find_if

#include "equiv/equivalency_step.hpp"

namespace equiv {

namespace {

auto find_named(const step_list& steps, std::string_view name)
    -> step_list::const_iterator
{
    return std::find_if(begin(steps), end(steps), [name](const auto& step) {
        return step.name == name;
    });
}

}

auto insert_before(step_list& steps, std::string_view name,
                   equivalency_step step) -> void
{
    steps.insert(find_named(steps, name), std::move(step));
}

auto find_step(const step_list& steps, std::string_view name)
    -> const equivalency_step*
{
    const auto found = find_named(steps, name);
    return (found != end(steps))? &(*found): nullptr;
}

}
