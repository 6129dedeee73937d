#include "equiv/member_selection.hpp"

namespace equiv {

auto select_members(const node& parent,
                    const object& expectation,
                    const equivalency_options& options)
    -> std::vector<const member*>
{
    auto result = std::vector<const member*>{};
    for (auto&& entry: expectation.members) {
        if (!options.is_excluded(parent.member(entry.name,
                                               entry.declared_type))) {
            result.push_back(&entry);
        }
    }
    return result;
}

}
