#include <sstream> // for std::ostringstream

#include "equiv/equivalency.hpp"
#include "equiv/equivalency_pipeline.hpp"
#include "equiv/logging.hpp"
#include "equiv/node.hpp"

#include "indenting_ostreambuf.hpp"

namespace equiv {

auto check_equivalence(const value& subject,
                       const value& expectation,
                       const equivalency_options& options,
                       const reason& because,
                       const std::optional<type_id>& declared_type)
    -> assertion_chain
{
    auto chain = assertion_chain{};
    chain.because_of(because);
    chain.begin_assertion();
    EQUIV_LOG_DEBUG("checking {} against {}", to_string(subject),
                    to_string(expectation));
    auto pipeline = equivalency_pipeline{make_steps(options), chain};
    pipeline.evaluate(comparands{subject, expectation, declared_type},
                      node::root(declared_type), options);
    EQUIV_LOG_DEBUG("check found {} failure(s)", size(chain.failures()));
    return chain;
}

auto check_equivalence(const value& subject,
                       const value& expectation,
                       const reason& because,
                       const std::optional<type_id>& declared_type)
    -> assertion_chain
{
    return check_equivalence(subject, expectation, default_options(),
                             because, declared_type);
}

auto check_equivalence(const value& subject,
                       const value& expectation,
                       const options_configurer& configure,
                       const reason& because,
                       const std::optional<type_id>& declared_type)
    -> assertion_chain
{
    return check_equivalence(subject, expectation,
                             configure(default_options()),
                             because, declared_type);
}

auto assert_equivalent(const value& subject,
                       const value& expectation,
                       const equivalency_options& options,
                       const reason& because,
                       const std::optional<type_id>& declared_type)
    -> void
{
    const auto chain = check_equivalence(subject, expectation, options,
                                         because, declared_type);
    if (!chain.succeeded()) {
        std::ostringstream os;
        report(os, chain);
        throw assertion_failed{os.str()};
    }
}

auto assert_equivalent(const value& subject,
                       const value& expectation,
                       const reason& because,
                       const std::optional<type_id>& declared_type)
    -> void
{
    assert_equivalent(subject, expectation, default_options(),
                      because, declared_type);
}

auto report(std::ostream& os, const assertion_chain& chain) -> void
{
    const auto& failures = chain.failures();
    os << chain.assertion_count() << " assertion(s), ";
    os << size(failures) << " failure(s)";
    if (empty(failures)) {
        os << '\n';
        return;
    }
    os << ":\n";
    for (auto&& failure: failures) {
        os << "- ";
        const auto indenter = detail::indenting_ostreambuf{os, 2, false};
        os << failure << '\n';
    }
}

}
