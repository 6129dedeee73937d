#include <gtest/gtest.h>

#include "equiv/assertion_chain.hpp"

using namespace equiv;

TEST(assertion_chain, default_construction)
{
    const auto chain = assertion_chain{};
    EXPECT_TRUE(chain.succeeded());
    EXPECT_TRUE(empty(chain.failures()));
    EXPECT_EQ(chain.assertion_count(), 0u);
    EXPECT_EQ(chain.subject(), "subject");
    EXPECT_EQ(chain.get_reason(), reason{});
}

TEST(assertion_chain, fail_with)
{
    auto chain = assertion_chain{};
    chain.fail_with("Expected {0} to be {1}.", {"a", "b"});
    EXPECT_FALSE(chain.succeeded());
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0], "Expected a to be b.");
}

TEST(assertion_chain, failures_aggregate)
{
    auto chain = assertion_chain{};
    chain.fail_with("first");
    chain.fail_with("second");
    ASSERT_EQ(size(chain.failures()), 2u);
    EXPECT_EQ(chain.failures()[1], "second");
}

TEST(assertion_chain, for_condition)
{
    auto chain = assertion_chain{};
    chain.for_condition(true).fail_with("not recorded");
    EXPECT_TRUE(chain.succeeded());
    chain.for_condition(false).fail_with("recorded");
    EXPECT_FALSE(chain.succeeded());
}

TEST(assertion_chain, condition_is_consumed)
{
    auto chain = assertion_chain{};
    chain.for_condition(true).fail_with("not recorded");
    chain.fail_with("recorded");
    EXPECT_EQ(size(chain.failures()), 1u);
}

TEST(assertion_chain, because_of)
{
    auto chain = assertion_chain{};
    chain.because_of({"{0} needs it", {"billing"}});
    EXPECT_EQ(chain.get_reason(), (reason{"{0} needs it", {"billing"}}));
    chain.fail_with("Expected {0}{reason}.", {"x"});
    EXPECT_EQ(chain.failures().at(0), "Expected x because billing needs it.");
}

TEST(assertion_chain, with_subject)
{
    auto chain = assertion_chain{};
    chain.with_subject("subject.Name");
    EXPECT_EQ(chain.subject(), "subject.Name");
    chain.fail_with("Expected {context} to be set.");
    EXPECT_EQ(chain.failures().at(0), "Expected subject.Name to be set.");
}

TEST(assertion_chain, begin_assertion)
{
    auto chain = assertion_chain{};
    chain.begin_assertion();
    chain.begin_assertion();
    EXPECT_EQ(chain.assertion_count(), 2u);
}

TEST(assertion_chain, reuse_once)
{
    auto chain = assertion_chain{};
    chain.begin_assertion();
    chain.reuse_once();
    chain.begin_assertion();
    EXPECT_EQ(chain.assertion_count(), 1u);
    chain.begin_assertion();
    EXPECT_EQ(chain.assertion_count(), 2u);
}

TEST(assertion_chain, consume_reuse)
{
    auto chain = assertion_chain{};
    EXPECT_FALSE(chain.consume_reuse());
    chain.reuse_once();
    EXPECT_TRUE(chain.consume_reuse());
    EXPECT_FALSE(chain.consume_reuse());
}
