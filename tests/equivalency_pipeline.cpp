#include <gtest/gtest.h>

#include <cstdlib> // for std::abs

#include "equiv/builtin_steps.hpp"
#include "equiv/equivalency.hpp"
#include "equiv/equivalency_pipeline.hpp"

using namespace equiv;

namespace {

auto node_type() -> type_id
{
    return object_type("Node");
}

/// @brief Makes a singly linked list of the given number of nodes.
auto make_list(int count) -> object_ptr
{
    auto head = object_ptr{};
    for (auto i = count - 1; i >= 0; --i) {
        head = make_object(node_type(), {
            {"Id", types::integer(), i},
            {"Next", node_type(), head},
        });
    }
    return head;
}

/// @brief Makes a node whose <code>Self</code> member refers to itself.
auto make_cyclic(const std::string& name) -> object_ptr
{
    auto result = make_object(node_type(), {
        {"Name", types::string(), name},
    });
    result->members.push_back({"Self", node_type(), result});
    return result;
}

auto approximately_equal(const comparands& values,
                         equivalency_context& context,
                         child_validator&) -> equivalency_result
{
    const auto subject = std::get_if<std::int64_t>(&values.subject.data);
    const auto expectation =
        std::get_if<std::int64_t>(&values.expectation.data);
    if (!subject || !expectation) {
        return equivalency_result::continue_with_next;
    }
    if (std::abs(*subject - *expectation) > 1) {
        context.chain.fail_with("Expected " +
                                escape_placeholders(
                                    context.current_node.description()) +
                                " to be about {0}{reason}.", {
                                    std::to_string(*expectation),
                                });
        return equivalency_result::assertion_failed;
    }
    return equivalency_result::equivalency_proven;
}

}

TEST(equivalency_result, is_terminal)
{
    EXPECT_FALSE(is_terminal(equivalency_result::continue_with_next));
    EXPECT_TRUE(is_terminal(equivalency_result::equivalency_proven));
    EXPECT_TRUE(is_terminal(equivalency_result::assertion_failed));
}

TEST(step_list, default_steps)
{
    const auto steps = default_steps();
    ASSERT_EQ(size(steps), 5u);
    EXPECT_EQ(steps[0].name, steps::reference_equality_name);
    EXPECT_EQ(steps[1].name, steps::sequence_equivalency_name);
    EXPECT_EQ(steps[2].name, steps::string_equality_name);
    EXPECT_EQ(steps[3].name, steps::structural_equality_name);
    EXPECT_EQ(steps[4].name, steps::simple_equality_name);
}

TEST(step_list, insert_before)
{
    auto steps = default_steps();
    insert_before(steps, steps::string_equality_name,
                  {"approximately_equal", approximately_equal});
    ASSERT_EQ(size(steps), 6u);
    EXPECT_EQ(steps[2].name, "approximately_equal");
    EXPECT_EQ(steps[3].name, steps::string_equality_name);

    insert_before(steps, "no_such_step", {"last", approximately_equal});
    EXPECT_EQ(steps.back().name, "last");
}

TEST(step_list, find_step)
{
    const auto steps = default_steps();
    const auto found = find_step(steps, steps::simple_equality_name);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found, &steps.back());
    EXPECT_EQ(find_step(steps, "no_such_step"), nullptr);
}

TEST(make_steps, custom_steps_come_first)
{
    const auto options = equivalency_options{}
        .using_step({"first", approximately_equal})
        .using_step({"second", approximately_equal});
    const auto steps = make_steps(options);
    ASSERT_EQ(size(steps), 7u);
    EXPECT_EQ(steps[0].name, "first");
    EXPECT_EQ(steps[1].name, "second");
    EXPECT_EQ(steps[2].name, steps::reference_equality_name);
}

TEST(equivalency_pipeline, custom_step_overrides_builtin)
{
    const auto options = equivalency_options{}
        .using_step({"approximately_equal", approximately_equal});
    EXPECT_TRUE(check_equivalence(10, 11, options).succeeded());
    EXPECT_FALSE(check_equivalence(10, 11, equivalency_options{})
                 .succeeded());

    const auto chain = check_equivalence(10, 13, options);
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0], "Expected subject to be about 13.");
}

TEST(equivalency_pipeline, no_applicable_step)
{
    auto chain = assertion_chain{};
    auto pipeline = equivalency_pipeline{step_list{}, chain};
    const auto options = equivalency_options{};
    EXPECT_THROW(pipeline.evaluate(comparands{1, 1, {}}, node::root(),
                                   options),
                 no_applicable_step);

    auto structural_only = equivalency_pipeline{step_list{
        {steps::structural_equality_name, steps::structural_equality},
    }, chain};
    EXPECT_THROW(structural_only.evaluate(comparands{1, 1, {}}, node::root(),
                                          options),
                 no_applicable_step);
}

TEST(equivalency_pipeline, visiting_is_scoped_to_the_path)
{
    auto chain = assertion_chain{};
    auto pipeline = equivalency_pipeline{default_steps(), chain};
    const auto subject = make_list(3);
    const auto expectation = make_list(3);
    pipeline.evaluate(comparands{subject, expectation, node_type()},
                      node::root(node_type()), equivalency_options{});
    EXPECT_TRUE(chain.succeeded());
    EXPECT_TRUE(empty(pipeline.visiting()));
}

TEST(equivalency_pipeline, max_recursion_depth)
{
    const auto options = equivalency_options{}.with_max_recursion_depth(2);
    const auto chain = check_equivalence(make_list(4), make_list(4), options);
    ASSERT_FALSE(chain.succeeded());
    EXPECT_EQ(chain.failures()[0],
              "The maximum recursion depth of 2 was reached at "
              "subject.Next.Next.Id.");
}

TEST(equivalency_pipeline, default_max_recursion_depth)
{
    EXPECT_TRUE(check_equivalence(make_list(10), make_list(10)).succeeded());
    EXPECT_FALSE(check_equivalence(make_list(12), make_list(12)).succeeded());
}

TEST(equivalency_pipeline, allowing_infinite_recursion)
{
    const auto options = equivalency_options{}.allowing_infinite_recursion();
    EXPECT_TRUE(check_equivalence(make_list(32), make_list(32), options)
                .succeeded());
}

TEST(equivalency_pipeline, cyclic_references_are_equivalent)
{
    const auto subject = make_cyclic("x");
    const auto expectation = make_cyclic("x");
    const auto chain = check_equivalence(subject, expectation);
    EXPECT_TRUE(chain.succeeded());
    subject->members.clear();
    expectation->members.clear();
}

TEST(equivalency_pipeline, cyclic_references_with_divergence)
{
    const auto subject = make_cyclic("x");
    const auto expectation = make_cyclic("y");
    const auto chain = check_equivalence(subject, expectation);
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject.Name to be \"y\", but \"x\" differs near "
              "\"x\" (index 0).");
    subject->members.clear();
    expectation->members.clear();
}

TEST(equivalency_pipeline, failing_on_cyclic_references)
{
    const auto subject = make_cyclic("x");
    const auto expectation = make_cyclic("x");
    const auto options = equivalency_options{}.failing_on_cyclic_references();
    const auto chain = check_equivalence(subject, expectation, options);
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject.Self to be Node, but it contains a cyclic "
              "reference.");
    subject->members.clear();
    expectation->members.clear();
}

TEST(equivalency_pipeline, shared_nodes_on_different_paths)
{
    const auto shared = make_object(node_type(), {
        {"Name", types::string(), "x"},
    });
    const auto other = make_object(node_type(), {
        {"Name", types::string(), "x"},
    });
    const auto pair_type = object_type("Pair");
    const auto subject = make_object(pair_type, {
        {"Left", node_type(), shared},
        {"Right", node_type(), shared},
    });
    const auto expectation = make_object(pair_type, {
        {"Left", node_type(), other},
        {"Right", node_type(), other},
    });
    const auto options = equivalency_options{}.failing_on_cyclic_references();
    EXPECT_TRUE(check_equivalence(subject, expectation, options).succeeded());
}

TEST(equivalency_pipeline, try_validate_records_nothing)
{
    auto chain = assertion_chain{};
    auto pipeline = equivalency_pipeline{default_steps(), chain};
    const auto root = node::root();
    const auto options = equivalency_options{};
    EXPECT_FALSE(pipeline.try_validate(comparands{1, 2, {}}, root, options));
    EXPECT_TRUE(pipeline.try_validate(comparands{1, 1, {}}, root, options));
    EXPECT_TRUE(chain.succeeded());
    pipeline.validate(comparands{1, 2, {}}, root, options);
    EXPECT_EQ(size(chain.failures()), 1u);
}
