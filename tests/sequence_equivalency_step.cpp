#include <gtest/gtest.h>

#include "equiv/equivalency.hpp"

using namespace equiv;

namespace {

auto order_type() -> type_id
{
    return object_type("Order");
}

auto make_order(int id, const std::string& product) -> value
{
    return make_object(order_type(), {
        {"Id", types::integer(), id},
        {"Product", types::string(), product},
    });
}

}

TEST(sequence_equivalency, equivalent)
{
    EXPECT_TRUE(check_equivalence(make_sequence({1, 2, 3}),
                                  make_sequence({1, 2, 3})).succeeded());
    EXPECT_TRUE(check_equivalence(make_sequence({}),
                                  make_sequence({})).succeeded());
}

TEST(sequence_equivalency, any_order_by_default)
{
    EXPECT_TRUE(check_equivalence(make_sequence({3, 1, 2}),
                                  make_sequence({1, 2, 3})).succeeded());
    EXPECT_TRUE(check_equivalence(make_sequence({1, 1, 2}),
                                  make_sequence({1, 2, 1})).succeeded());
}

TEST(sequence_equivalency, strict_ordering)
{
    const auto options = equivalency_options{}.with_strict_ordering();
    const auto chain = check_equivalence(make_sequence({2, 1}),
                                         make_sequence({1, 2}), options);
    ASSERT_EQ(size(chain.failures()), 2u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject[0] to be 1, but found 2.");
    EXPECT_EQ(chain.failures()[1],
              "Expected subject[1] to be 2, but found 1.");
}

TEST(sequence_equivalency, unmatched_item_reports_details)
{
    const auto chain = check_equivalence(make_sequence({1, 5, 3}),
                                         make_sequence({1, 2, 3}));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject[1] to be 2, but found 5.");
}

TEST(sequence_equivalency, unmatched_item_without_counterpart)
{
    const auto chain = check_equivalence(make_sequence({1}),
                                         make_sequence({1, 2}));
    ASSERT_EQ(size(chain.failures()), 2u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject to be a collection with 2 item(s), but "
              "{1} contains 1 item(s).");
    EXPECT_EQ(chain.failures()[1],
              "Expected subject to contain an item equivalent to 2, but no "
              "such item was found.");
}

TEST(sequence_equivalency, matches_before_reporting)
{
    const auto chain = check_equivalence(
        make_sequence({"a", "y"}, types::string()),
        make_sequence({"x", "a"}, types::string()));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject[1] to be \"x\", but \"y\" differs near \"y\" "
              "(index 0).");
}

TEST(sequence_equivalency, reports_against_first_unmatched_item)
{
    const auto chain = check_equivalence(make_sequence({2, 7, 9}),
                                         make_sequence({4, 2, 9}));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject[1] to be 4, but found 7.");
}

TEST(sequence_equivalency, count_mismatch)
{
    const auto chain = check_equivalence(make_sequence({1, 2, 3}),
                                         make_sequence({1, 2}));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject to be a collection with 2 item(s), but "
              "{1, 2, 3} contains 3 item(s).");
}

TEST(sequence_equivalency, subject_not_a_sequence)
{
    const auto chain = check_equivalence(42, make_sequence({1}));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject to be a collection, but found 42.");
}

TEST(sequence_equivalency, subject_absent)
{
    const auto chain = check_equivalence(value{}, make_sequence({1}));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject to be {1}, but found <null>.");
}

TEST(sequence_equivalency, objects_in_any_order)
{
    const auto subject = make_sequence({
        make_order(2, "Pen"), make_order(1, "Book"),
    }, order_type());
    const auto expectation = make_sequence({
        make_order(1, "Book"), make_order(2, "Pen"),
    }, order_type());
    EXPECT_TRUE(check_equivalence(subject, expectation).succeeded());
}

TEST(sequence_equivalency, object_item_paths)
{
    const auto subject = make_sequence({
        make_order(1, "Book"), make_order(2, "Pencil"),
    }, order_type());
    const auto expectation = make_sequence({
        make_order(1, "Book"), make_order(2, "Pen"),
    }, order_type());
    const auto options = equivalency_options{}.with_strict_ordering();
    const auto chain = check_equivalence(subject, expectation, options);
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject[1].Product to be \"Pen\" with a length of 3, "
              "but \"Pencil\" has a length of 6, differs near \"cil\" "
              "(index 3).");
}

TEST(sequence_equivalency, excluding_through_items)
{
    const auto subject = make_object(object_type("Customer"), {
        {"Orders", types::sequence(), make_sequence({
            make_order(7, "Book"),
        }, order_type())},
    });
    const auto expectation = make_object(object_type("Customer"), {
        {"Orders", types::sequence(), make_sequence({
            make_order(1, "Book"),
        }, order_type())},
    });
    EXPECT_FALSE(check_equivalence(subject, expectation).succeeded());
    const auto options = equivalency_options{}.excluding("Orders.Id");
    EXPECT_TRUE(check_equivalence(subject, expectation, options).succeeded());
}
