#include <gtest/gtest.h>

#include "equiv/builtin_steps.hpp"
#include "equiv/equivalency.hpp"

using namespace equiv;

namespace {

auto customer_type() -> type_id
{
    return object_type("Customer");
}

auto address_type() -> type_id
{
    return object_type("Address");
}

auto make_address(const std::string& city) -> object_ptr
{
    return make_object(address_type(), {
        {"Street", types::string(), "Main St"},
        {"City", types::string(), city},
    });
}

auto make_customer(const std::string& name, int age, const std::string& city)
    -> object_ptr
{
    return make_object(customer_type(), {
        {"Name", types::string(), name},
        {"Age", types::integer(), age},
        {"Address", address_type(), make_address(city)},
    });
}

}

TEST(structural_equality, equivalent)
{
    const auto chain = check_equivalence(make_customer("John", 42, "Paris"),
                                         make_customer("John", 42, "Paris"));
    EXPECT_TRUE(chain.succeeded());
    EXPECT_EQ(chain.assertion_count(), 1u);
}

TEST(structural_equality, reports_full_paths)
{
    const auto chain = check_equivalence(make_customer("John", 41, "Paris"),
                                         make_customer("John", 42, "Rome"));
    ASSERT_EQ(size(chain.failures()), 2u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject.Age to be 42, but found 41.");
    EXPECT_EQ(chain.failures()[1],
              "Expected subject.Address.City to be \"Rome\" with a length of "
              "4, but \"Paris\" has a length of 5, differs near \"Par\" "
              "(index 0).");
}

TEST(structural_equality, reason)
{
    const auto chain = check_equivalence(make_customer("John", 41, "Paris"),
                                         make_customer("John", 42, "Paris"),
                                         reason{"ages are {0}", {"exact"}});
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject.Age to be 42 because ages are exact, but "
              "found 41.");
}

TEST(structural_equality, missing_member)
{
    const auto subject = make_object(customer_type(), {
        {"Name", types::string(), "John"},
    });
    const auto expectation = make_object(customer_type(), {
        {"Name", types::string(), "John"},
        {"Email", types::string(), "john@example.com"},
    });
    const auto chain = check_equivalence(subject, expectation);
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expectation has member subject.Email that the other object "
              "does not have.");
}

TEST(structural_equality, extra_subject_members_are_ignored)
{
    const auto subject = make_object(customer_type(), {
        {"Name", types::string(), "John"},
        {"Email", types::string(), "john@example.com"},
    });
    const auto expectation = make_object(customer_type(), {
        {"Name", types::string(), "John"},
    });
    EXPECT_TRUE(check_equivalence(subject, expectation).succeeded());
}

TEST(structural_equality, excluding)
{
    const auto options = equivalency_options{}
        .excluding("Age")
        .excluding("Address.City");
    EXPECT_TRUE(check_equivalence(make_customer("John", 41, "Paris"),
                                  make_customer("John", 42, "Rome"),
                                  options).succeeded());
}

TEST(structural_equality, no_members_selected)
{
    const auto subject = make_object(customer_type(), {
        {"Id", types::integer(), 1},
    });
    const auto expectation = make_object(customer_type(), {
        {"Id", types::integer(), 1},
    });
    const auto options = equivalency_options{}.excluding("Id");
    EXPECT_THROW(check_equivalence(subject, expectation, options),
                 no_members_selected);
    EXPECT_THROW(check_equivalence(subject, make_object(customer_type())),
                 no_members_selected);
}

TEST(structural_equality, subject_absent)
{
    const auto chain = check_equivalence(value{},
                                         make_customer("John", 42, "Paris"));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject to be Customer, but found <null>.");
}

TEST(structural_equality, subject_not_an_object)
{
    const auto chain = check_equivalence("John",
                                         make_customer("John", 42, "Paris"));
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected subject to be Customer, but found string.");
}

TEST(structural_equality, same_object)
{
    const auto customer = make_customer("John", 42, "Paris");
    EXPECT_TRUE(check_equivalence(customer, customer).succeeded());
}

TEST(structural_equality, member_type_mismatch)
{
    const auto subject = make_object(customer_type(), {
        {"Age", types::any(), "42"},
    });
    const auto expectation = make_object(customer_type(), {
        {"Age", types::any(), 42},
    });
    const auto chain = check_equivalence(subject, expectation);
    ASSERT_EQ(size(chain.failures()), 1u);
    EXPECT_EQ(chain.failures()[0],
              "Expected member subject.Age to be int64, but found string.");
}

TEST(structural_equality, declared_types_decide_string_comparison)
{
    const auto subject = make_object(customer_type(), {
        {"Name", types::any(), "JOHN"},
    });
    const auto expectation = make_object(customer_type(), {
        {"Name", types::any(), "john"},
    });
    const auto options = equivalency_options{}.ignoring_case();
    EXPECT_FALSE(check_equivalence(subject, expectation, options)
                 .succeeded());
    EXPECT_TRUE(check_equivalence(subject, expectation,
                                  options.respecting_runtime_types())
                .succeeded());
}
