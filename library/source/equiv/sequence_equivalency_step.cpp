#include <algorithm> // for std::min, std::find
#include <iterator> // for std::distance
#include <string>
#include <vector>

#include "equiv/builtin_steps.hpp"

namespace equiv::steps {

namespace {

auto compare_in_order(const sequence& subject,
                      const sequence& expectation,
                      equivalency_context& context,
                      child_validator& children) -> void
{
    const auto& at = context.current_node;
    const auto count = std::min(size(subject.elements),
                                size(expectation.elements));
    for (auto i = std::size_t{0}; i < count; ++i) {
        children.validate(comparands{
            subject.elements[i], expectation.elements[i],
            expectation.element_type
        }, at.item(i, expectation.element_type), context.options);
    }
}

/// @brief Finds the subject item to report an unmatched expected item
///   against.
/// @return Index of the unmatched subject item at @index if there is one,
///   else of the first unmatched subject item, else the count of items.
auto counterpart_of(std::size_t index, const std::vector<bool>& matched)
    -> std::size_t
{
    if ((index < size(matched)) && !matched[index]) {
        return index;
    }
    const auto found = std::find(begin(matched), end(matched), false);
    return static_cast<std::size_t>(std::distance(begin(matched), found));
}

auto compare_in_any_order(const sequence& subject,
                          const sequence& expectation,
                          equivalency_context& context,
                          child_validator& children) -> void
{
    const auto& at = context.current_node;
    const auto& type = expectation.element_type;
    auto matched = std::vector<bool>(size(subject.elements), false);
    auto unmatched = std::vector<std::size_t>{};

    // Pairs up equivalent items before any item gets reported, so that an
    // item isn't reported against a subject item another one matches.
    for (auto i = std::size_t{0}; i < size(expectation.elements); ++i) {
        auto found = false;
        for (auto j = std::size_t{0}; j < size(subject.elements); ++j) {
            if (matched[j]) {
                continue;
            }
            if (children.try_validate(comparands{
                subject.elements[j], expectation.elements[i], type
            }, at.item(j, type), context.options)) {
                matched[j] = true;
                found = true;
                break;
            }
        }
        if (!found) {
            unmatched.push_back(i);
        }
    }

    for (auto&& i: unmatched) {
        const auto& expected = expectation.elements[i];
        const auto j = counterpart_of(i, matched);
        if (j < size(subject.elements)) {
            matched[j] = true;
            children.validate(comparands{
                subject.elements[j], expected, type
            }, at.item(j, type), context.options);
            continue;
        }
        context.chain.fail_with("Expected " +
                                escape_placeholders(at.description()) +
                                " to contain an item equivalent to {0}"
                                "{reason}, but no such item was found.", {
                                    to_string(expected),
                                });
    }
}

}

auto sequence_equivalency(const comparands& values,
                          equivalency_context& context,
                          child_validator& children) -> equivalency_result
{
    const auto expectation =
        std::get_if<sequence_ptr>(&values.expectation.data);
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
    const auto subject = std::get_if<sequence_ptr>(&values.subject.data);
    if (!subject) {
        chain.fail_with("Expected " + escape_placeholders(to_string(at)) +
                        " to be a collection{reason}, but found {0}.", {
                            to_string(values.subject),
                        });
        return equivalency_result::assertion_failed;
    }

    const auto failures_before = size(chain.failures());
    const auto expected_count = size((*expectation)->elements);
    const auto actual_count = size((*subject)->elements);
    if (expected_count != actual_count) {
        chain.fail_with("Expected " + escape_placeholders(at.description()) +
                        " to be a collection with {0} item(s){reason}, but "
                        "{1} contains {2} item(s).", {
                            std::to_string(expected_count),
                            to_string(values.subject),
                            std::to_string(actual_count),
                        });
    }
    if (context.options.item_ordering() == ordering::strict) {
        compare_in_order(**subject, **expectation, context, children);
    }
    else {
        compare_in_any_order(**subject, **expectation, context, children);
    }
    return (size(chain.failures()) == failures_before)
        ? equivalency_result::equivalency_proven
        : equivalency_result::assertion_failed;
}

}
