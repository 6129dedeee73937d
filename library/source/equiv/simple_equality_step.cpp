#include "equiv/builtin_steps.hpp"

namespace equiv::steps {

auto simple_equality(const comparands& values,
                     equivalency_context& context,
                     child_validator&) -> equivalency_result
{
    auto& chain = context.chain;
    const auto& at = context.current_node;
    const auto expectation_null = is_null(values.expectation);
    const auto subject_null = is_null(values.subject);
    if (expectation_null && subject_null) {
        return equivalency_result::equivalency_proven;
    }
    if (!expectation_null && !subject_null &&
        (values.expectation.data.index() != values.subject.data.index())) {
        chain.fail_with("Expected " + escape_placeholders(to_string(at)) +
                        " to be {0}{reason}, but found {1}.", {
                            runtime_type(values.expectation)->name,
                            runtime_type(values.subject)->name,
                        });
        return equivalency_result::assertion_failed;
    }
    if (!(values.subject == values.expectation)) {
        chain.fail_with("Expected " + escape_placeholders(at.description()) +
                        " to be {0}{reason}, but found {1}.", {
                            to_string(values.expectation),
                            to_string(values.subject),
                        });
        return equivalency_result::assertion_failed;
    }
    return equivalency_result::equivalency_proven;
}

}
