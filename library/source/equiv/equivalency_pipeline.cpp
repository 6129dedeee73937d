#include <algorithm> // for std::find
#include <string>
#include <utility> // for std::exchange

#include "equiv/builtin_steps.hpp"
#include "equiv/equivalency_context.hpp"
#include "equiv/equivalency_pipeline.hpp"
#include "equiv/logging.hpp"

namespace equiv {

namespace {

/// @brief Keeps an identity pair on the current path for its lifetime.
struct visit_guard
{
    using container = std::vector<equivalency_pipeline::identity_pair>;

    visit_guard(container& visits,
                const equivalency_pipeline::identity_pair& pair,
                bool track):
        visits_{track? &visits: nullptr}
    {
        if (visits_) {
            visits_->push_back(pair);
        }
    }

    visit_guard(const visit_guard&) = delete;
    auto operator=(const visit_guard&) -> visit_guard& = delete;

    ~visit_guard()
    {
        if (visits_) {
            visits_->pop_back();
        }
    }

private:
    container* visits_;
};

/// @brief Swaps in another chain for its lifetime.
struct chain_swap
{
    chain_swap(assertion_chain*& slot, assertion_chain& replacement):
        slot_{slot}, saved_{std::exchange(slot, &replacement)}
    {
        // Intentionally empty.
    }

    chain_swap(const chain_swap&) = delete;
    auto operator=(const chain_swap&) -> chain_swap& = delete;

    ~chain_swap()
    {
        slot_ = saved_;
    }

private:
    assertion_chain*& slot_;
    assertion_chain* saved_;
};

auto exceeds_depth(const node& at, const equivalency_options& options)
    -> bool
{
    return !options.allow_infinite_recursion()
        && (at.depth() > options.max_recursion_depth());
}

}

equivalency_pipeline::equivalency_pipeline(step_list steps,
                                           assertion_chain& chain):
    steps_{std::move(steps)}, chain_{&chain}
{
    // Intentionally empty.
}

auto equivalency_pipeline::evaluate(const comparands& values,
                                    const node& at,
                                    const equivalency_options& options)
    -> void
{
    auto& chain = *chain_;
    if (exceeds_depth(at, options)) {
        EQUIV_LOG_WARN("maximum recursion depth of {} reached at {}",
                       options.max_recursion_depth(), at.description());
        chain.fail_with("The maximum recursion depth of {0} was reached at " +
                        escape_placeholders(at.description()) +
                        "{reason}.", {
                            std::to_string(options.max_recursion_depth()),
                        });
        return;
    }

    const auto pair = identity_pair{
        identity_of(values.expectation), identity_of(values.subject)
    };
    const auto track = pair.first && pair.second;
    if (track && (std::find(begin(visiting_), end(visiting_), pair)
                  != end(visiting_))) {
        if (options.cyclic_references() == cyclic_reference_handling::fail) {
            chain.fail_with("Expected " +
                            escape_placeholders(at.description()) +
                            " to be {0}{reason}, but it contains a cyclic "
                            "reference.", {
                                to_string(values.expectation),
                            });
            return;
        }
        EQUIV_LOG_DEBUG("cyclic reference at {} taken as equivalent",
                        at.description());
        return;
    }
    const auto guard = visit_guard{visiting_, pair, track};

    auto context = equivalency_context{at, options, chain};
    for (auto&& step: steps_) {
        const auto result = step.handle(values, context, *this);
        if (is_terminal(result)) {
            EQUIV_LOG_TRACE("{} resolved {} as {}", step.name,
                            at.description(),
                            (result == equivalency_result::equivalency_proven)
                                ? "equivalent": "failed");
            return;
        }
    }
    EQUIV_LOG_ERROR("no step applies to {}", at.description());
    throw no_applicable_step{"no equivalency step applies to " +
                             at.description()};
}

auto equivalency_pipeline::validate(const comparands& child,
                                    const node& child_node,
                                    const equivalency_options& child_options)
    -> void
{
    evaluate(child, child_node, child_options);
}

auto equivalency_pipeline::try_validate(const comparands& child,
                                        const node& child_node,
                                        const equivalency_options& child_options)
    -> bool
{
    auto trial = assertion_chain{chain_->subject()};
    trial.because_of(chain_->get_reason());
    trial.begin_assertion();
    {
        const auto swap = chain_swap{chain_, trial};
        evaluate(child, child_node, child_options);
    }
    return trial.succeeded();
}

auto equivalency_pipeline::steps() const noexcept -> const step_list&
{
    return steps_;
}

auto equivalency_pipeline::visiting() const noexcept
    -> const std::vector<identity_pair>&
{
    return visiting_;
}

auto make_steps(const equivalency_options& options) -> step_list
{
    auto result = options.custom_steps();
    for (auto&& step: default_steps()) {
        result.push_back(step);
    }
    return result;
}

}
