#include "equiv/builtin_steps.hpp"
#include "equiv/logging.hpp"
#include "equiv/member_selection.hpp"

namespace equiv::steps {

auto structural_equality(const comparands& values,
                         equivalency_context& context,
                         child_validator& children) -> equivalency_result
{
    const auto expectation = std::get_if<object_ptr>(&values.expectation.data);
    if (!expectation || !*expectation) {
        return equivalency_result::continue_with_next;
    }

    auto& chain = context.chain;
    const auto& at = context.current_node;
    if (is_null(values.subject)) {
        chain.fail_with("Expected " + escape_placeholders(at.description()) +
                        " to be {0}{reason}, but found {1}.", {
                            to_string(values.expectation),
                            to_string(values.subject),
                        });
        return equivalency_result::assertion_failed;
    }
    const auto subject = std::get_if<object_ptr>(&values.subject.data);
    if (!subject) {
        chain.fail_with("Expected " + escape_placeholders(to_string(at)) +
                        " to be {0}{reason}, but found {1}.", {
                            (*expectation)->type.name,
                            runtime_type(values.subject)->name,
                        });
        return equivalency_result::assertion_failed;
    }

    const auto members = select_members(at, **expectation, context.options);
    if (empty(members)) {
        EQUIV_LOG_ERROR("no members of {} to compare", at.description());
        throw no_members_selected{
            "no members were found for comparison of " + at.description() +
            " of type " + (*expectation)->type.name
        };
    }

    const auto failures_before = size(chain.failures());
    for (auto&& entry: members) {
        const auto child = at.member(entry->name, entry->declared_type);
        const auto found = find_member(**subject, entry->name);
        if (!found) {
            chain.fail_with("Expectation has member " +
                            escape_placeholders(child.description()) +
                            " that the other object does not have{reason}.");
            continue;
        }
        children.validate(comparands{
            found->data, entry->data, entry->declared_type
        }, child, context.options);
    }
    return (size(chain.failures()) == failures_before)
        ? equivalency_result::equivalency_proven
        : equivalency_result::assertion_failed;
}

}
