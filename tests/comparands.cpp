#include <gtest/gtest.h>

#include "equiv/comparands.hpp"
#include "equiv/equivalency_options.hpp"

using namespace equiv;

TEST(comparands, runtime_type)
{
    EXPECT_EQ((comparands{1, "a", types::any()}.runtime_type()),
              types::string());
    EXPECT_EQ((comparands{1, {}, types::integer()}.runtime_type()),
              types::integer());
    EXPECT_FALSE((comparands{1, {}, {}}.runtime_type()));
}

TEST(comparands, expected_type_respecting_declared_types)
{
    const auto options = equivalency_options{};
    EXPECT_EQ((comparands{"a", "b", types::any()}.get_expected_type(options)),
              types::any());
    EXPECT_EQ((comparands{"a", "b", types::string()}
               .get_expected_type(options)), types::string());
}

TEST(comparands, expected_type_respecting_runtime_types)
{
    const auto options = equivalency_options{}.respecting_runtime_types();
    EXPECT_EQ((comparands{"a", "b", types::any()}.get_expected_type(options)),
              types::string());
    EXPECT_EQ((comparands{"a", {}, types::string()}
               .get_expected_type(options)), types::string());
}

TEST(comparands, expected_type_without_declared_type)
{
    const auto options = equivalency_options{};
    EXPECT_EQ((comparands{"a", 2, {}}.get_expected_type(options)),
              types::integer());
    EXPECT_EQ((comparands{"a", {}, {}}.get_expected_type(options)),
              types::string());
    EXPECT_FALSE((comparands{{}, {}, {}}.get_expected_type(options)));
}
