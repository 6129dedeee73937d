#include <stdexcept> // for std::invalid_argument
#include <string>
#include <utility> // for std::move

#include "equiv/builtin_steps.hpp"
#include "equiv/string_assertions.hpp"

namespace equiv {

namespace {

auto validate_against_nulls(assertion_chain& chain,
                            const comparands& values,
                            const node& at) -> bool
{
    const auto only_one_null =
        is_null(values.expectation) != is_null(values.subject);
    if (only_one_null) {
        chain.fail_with("Expected " + escape_placeholders(at.description()) +
                        " to be {0}{reason}, but found {1}.", {
                            to_string(values.expectation),
                            to_string(values.subject),
                        });
        return false;
    }
    return true;
}

/// @brief Gives a chain a subject description for the lifetime of this
///   object.
class subject_guard
{
public:
    subject_guard(assertion_chain& chain, std::string description):
        chain{chain}, previous{chain.subject()}
    {
        chain.with_subject(std::move(description));
    }

    subject_guard(const subject_guard&) = delete;
    auto operator=(const subject_guard&) -> subject_guard& = delete;

    ~subject_guard()
    {
        chain.with_subject(std::move(previous));
    }

private:
    assertion_chain& chain;
    std::string previous;
};

auto type_name(const std::optional<type_id>& type) -> std::string
{
    return type? type->name: std::string{reserved::null_display};
}

}

auto make_string_options(const equivalency_options& options)
    -> string_options
{
    const auto refined = options.refinement_for(types::string());
    if (const auto p = std::get_if<string_options>(&refined)) {
        return *p;
    }
    auto result = string_options{};
    if (options.ignore_leading_whitespace()) {
        result = result.ignoring_leading_whitespace();
    }
    if (options.ignore_trailing_whitespace()) {
        result = result.ignoring_trailing_whitespace();
    }
    if (options.ignore_case()) {
        result = result.ignoring_case();
    }
    if (options.ignore_newline_style()) {
        result = result.ignoring_newline_style();
    }
    return result;
}

}

namespace equiv::steps {

auto string_equality(const comparands& values,
                     equivalency_context& context,
                     child_validator&) -> equivalency_result
{
    const auto expected_type = values.get_expected_type(context.options);
    if (!expected_type || (*expected_type != types::string())) {
        return equivalency_result::continue_with_next;
    }

    auto& chain = context.chain;
    const auto& at = context.current_node;
    if (!validate_against_nulls(chain, values, at)) {
        return equivalency_result::assertion_failed;
    }
    if (is_null(values.expectation)) {
        return equivalency_result::equivalency_proven;
    }

    const auto expectation = std::get_if<std::string>(&values.expectation.data);
    if (!expectation) {
        throw std::invalid_argument{
            "expectation of " + at.description() + " declared as " +
            types::string().name + " but holds " +
            type_name(runtime_type(values.expectation))
        };
    }
    const auto subject = std::get_if<std::string>(&values.subject.data);
    if (!subject) {
        chain.fail_with("Expected " + escape_placeholders(to_string(at)) +
                        " to be {0}{reason}, but found {1}.", {
                            type_name(values.runtime_type()),
                            type_name(runtime_type(values.subject)),
                        });
        return equivalency_result::assertion_failed;
    }

    const auto guard = subject_guard{chain, at.description()};
    chain.reuse_once();
    const auto equivalent = be_equivalent_string(
        chain, *subject, *expectation, make_string_options(context.options));
    return equivalent
        ? equivalency_result::equivalency_proven
        : equivalency_result::assertion_failed;
}

}
