#include "equiv/builtin_steps.hpp"

namespace equiv::steps {

auto reference_equality(const comparands& values,
                        equivalency_context&,
                        child_validator&) -> equivalency_result
{
    if (is_null(values.expectation) && is_null(values.subject)) {
        return equivalency_result::equivalency_proven;
    }
    const auto identity = identity_of(values.expectation);
    if (identity && (identity == identity_of(values.subject))) {
        return equivalency_result::equivalency_proven;
    }
    return equivalency_result::continue_with_next;
}

}
