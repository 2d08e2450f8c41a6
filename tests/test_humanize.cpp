#include <gtest/gtest.h>
#include <limits>
#include <sstream>

#include "craftcalc/errors.hpp"
#include "craftcalc/humanize.hpp"
#include "test_util.hpp"

using namespace craftcalc;

TEST(HumanizeTest, RoundsUp) {
    EXPECT_EQ(round_up(2.01), 3);
    EXPECT_EQ(round_up(2.0), 2);
    EXPECT_EQ(round_up(0.0), 0);
    EXPECT_EQ(round_up(0.0125), 1);
    EXPECT_EQ(round_up(2.5), 3);
}

TEST(HumanizeTest, IgnoresFloatingPointNoise) {
    EXPECT_EQ(round_up(0.1 * 3 / 0.3), 1);
    EXPECT_EQ(round_up(2.0000000000004), 2);
    EXPECT_EQ(round_up(2.000001), 3);
    EXPECT_EQ(round_up(2.0000000005), 3);
    // Noise scales with the magnitude of large totals.
    EXPECT_EQ(round_up(1e7 * (0.1 * 3 / 0.3)), 10000000);
    EXPECT_EQ(round_up(10000000.5), 10000001);
}

TEST(HumanizeTest, RejectsCountsTooLargeToHold) {
    EXPECT_THROW(round_up(1e300), InvalidRate);
    EXPECT_THROW(round_up(9223372036854775808.0), InvalidRate);
    EXPECT_THROW(round_up(std::numeric_limits<double>::infinity()), InvalidRate);
    EXPECT_THROW(round_up(std::numeric_limits<double>::quiet_NaN()), InvalidRate);
    EXPECT_EQ(round_up(1e18), 1000000000000000000LL);

    Catalog catalog;
    catalog.add(test::made("x", 2.0, {}));
    Engine engine(catalog);
    const Totals totals = engine.producers_needed("x", 1e300, 1);
    EXPECT_DOUBLE_EQ(totals.at("x"), 2e300);
    EXPECT_THROW(round_up(totals), InvalidRate);
}

TEST(HumanizeTest, RoundsEveryEntry) {
    Totals totals{{"gear", 0.5}, {"red_sci", 5.0}, {"pipe", 1.2}};
    auto rounded = round_up(totals);
    EXPECT_EQ(rounded.size(), 3u);
    EXPECT_EQ(rounded["gear"], 1);
    EXPECT_EQ(rounded["red_sci"], 5);
    EXPECT_EQ(rounded["pipe"], 2);
}

TEST(HumanizeTest, WritesOneLinePerComponent) {
    Totals totals{{"red_sci", 5.0}, {"gear", 0.5}};
    std::ostringstream out;
    humanize(out, totals);
    EXPECT_EQ(out.str(), "gear : 1\nred_sci : 5\n");
}

TEST(HumanizeTest, EmptyTotalsWriteNothing) {
    std::ostringstream out;
    humanize(out, Totals{});
    EXPECT_TRUE(out.str().empty());
}
