#include <gtest/gtest.h>

#include "errors.hpp"
#include "parameters.hpp"

TEST(ParametersTest, DefaultsMatchInteractiveApp) {
    Parameters p;
    EXPECT_EQ(p.n, 5);
    EXPECT_EQ(p.width, 10);
    EXPECT_EQ(p.height, 10);
    EXPECT_EQ(p.dirty_percent, 100);
    EXPECT_EQ(p.max_steps, 200);
    EXPECT_FALSE(p.seed.has_value());
    EXPECT_NO_THROW(validate(p));
}

TEST(ParametersTest, ParseIntAcceptsWholeNumbers) {
    EXPECT_EQ(parse_int("n", "5"), 5);
    EXPECT_EQ(parse_int("dirty_percent", "-1"), -1);   // range is validate()'s job
}

TEST(ParametersTest, ParseIntRejectsJunk) {
    EXPECT_THROW(parse_int("n", "5x"), InvalidConfigurationError);
    EXPECT_THROW(parse_int("n", "abc"), InvalidConfigurationError);
    EXPECT_THROW(parse_int("n", ""), InvalidConfigurationError);
    EXPECT_THROW(parse_int("n", "99999999999"), InvalidConfigurationError);
}

TEST(ParametersTest, ParseSeedRejectsSignAndOverflow) {
    EXPECT_EQ(parse_seed("42"), 42u);
    EXPECT_EQ(parse_seed("18446744073709551615"), 18446744073709551615ull);
    EXPECT_THROW(parse_seed("-5"), InvalidConfigurationError);
    EXPECT_THROW(parse_seed("+5"), InvalidConfigurationError);
    EXPECT_THROW(parse_seed("7seven"), InvalidConfigurationError);
    EXPECT_THROW(parse_seed(""), InvalidConfigurationError);
    EXPECT_THROW(parse_seed("18446744073709551616"), InvalidConfigurationError);
}
