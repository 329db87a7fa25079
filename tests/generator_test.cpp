#include "propcheck_gtest.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <vector>

TEST(Generator, ConstantAlwaysYieldsItsValue) {
    RandSource rand(1);
    auto gen = Gen::constant(std::string("same"));
    for (int i = 0; i < 50; i++) {
        EXPECT_EQ(gen(rand), "same");
    }
}

TEST(Generator, ChooseValueStaysWithinTheList) {
    PROPCHECK_EXPECT_HOLDS([](int64_t n) { return n == 1 || n == 2 || n == 3; },
                           Gen::choose_value<int64_t>({1, 2, 3}));
}

TEST(Generator, ChooseValueReachesEveryElement) {
    RandSource rand(7);
    auto gen = Gen::choose_value<std::string>({"a", "b", "c"});
    std::set<std::string> seen;
    for (int i = 0; i < 200; i++) {
        seen.insert(gen(rand));
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST(Generator, ChooseValueRejectsEmptyList) {
    EXPECT_THROW(Gen::choose_value<int>({}), MisuseError);
}

TEST(Generator, ChooseRejectsEmptyList) {
    EXPECT_THROW(Gen::choose<int>({}), MisuseError);
}

TEST(Generator, ChoosePicksFamiliesNotValues) {
    // One family is a single value, the other is four billion of them; both
    // get picked about half of the time.
    RandSource rand(11);
    auto gen = Gen::choose<int64_t>({Gen::constant<int64_t>(0), Gen::int_range(1, 4000000000LL)});
    int zeros = 0;
    for (int i = 0; i < 1000; i++) {
        if (gen(rand) == 0) { zeros++; }
    }
    EXPECT_GT(zeros, 350);
    EXPECT_LT(zeros, 650);
}

TEST(Generator, MapTransformsEveryValue) {
    PROPCHECK_EXPECT_HOLDS([](int64_t n) { return n % 2 == 0 && n >= 0 && n <= 20; },
                           Gen::int_range(0, 10).map([](int64_t n) { return n * 2; }));
}

TEST(Generator, FreeMapMatchesMemberMap) {
    auto gen = Gen::map(Gen::constant(20), [](int n) { return std::to_string(n); });
    RandSource rand(3);
    EXPECT_EQ(gen(rand), "20");
}

TEST(Generator, IntRangeStaysWithinBounds) {
    PROPCHECK_EXPECT_HOLDS([](int64_t n) { return n >= -3 && n <= 10; }, Gen::int_range(-3, 10));
}

TEST(Generator, IntRangeHitsBothEnds) {
    RandSource rand(5);
    auto gen = Gen::int_range(0, 3);
    std::set<int64_t> seen;
    for (int i = 0; i < 200; i++) {
        seen.insert(gen(rand));
    }
    EXPECT_EQ(seen, (std::set<int64_t>{0, 1, 2, 3}));
}

TEST(Generator, IntRangeWithEqualBoundsIsConstant) {
    RandSource rand(9);
    auto gen = Gen::int_range(4, 4);
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(gen(rand), 4);
    }
}

TEST(Generator, IntRangeRejectsInvertedBounds) {
    EXPECT_THROW(Gen::int_range(10, 3), MisuseError);
}

TEST(Generator, IntFullStaysWithin32Bits) {
    PROPCHECK_EXPECT_HOLDS(
            [](int64_t n) {
                return n >= std::numeric_limits<int32_t>::min() && n <= std::numeric_limits<int32_t>::max();
            },
            Gen::int_full());
}

TEST(Generator, FloatFullIsFiniteAndWide) {
    RandSource rand(13);
    auto gen = Gen::float_full();
    double largest = 0;
    bool negative = false;
    for (int i = 0; i < 100; i++) {
        double d = gen(rand);
        ASSERT_TRUE(std::isfinite(d));
        ASSERT_LE(std::abs(d), static_cast<double>(std::numeric_limits<int64_t>::max()) / 2);
        largest = std::max(largest, std::abs(d));
        negative = negative || d < 0;
    }
    EXPECT_GT(largest, 1e15);
    EXPECT_TRUE(negative);
}

TEST(Generator, BooleanProducesBoth) {
    RandSource rand(17);
    auto gen = Gen::boolean();
    std::set<bool> seen;
    for (int i = 0; i < 100; i++) {
        seen.insert(gen(rand));
    }
    EXPECT_EQ(seen.size(), 2u);
}

TEST(Generator, ListLengthFollowsLengthGenerator) {
    PROPCHECK_EXPECT_HOLDS([](const std::vector<int64_t> &xs) { return xs.size() >= 2 && xs.size() <= 4; },
                           Gen::list(Gen::int_full(), Gen::int_range(2, 4)));
}

TEST(Generator, ListOfConstants) {
    RandSource rand(19);
    auto gen = Gen::list(Gen::choose_value<int64_t>({5}), Gen::int_range(3, 3));
    EXPECT_EQ(gen(rand), (std::vector<int64_t>{5, 5, 5}));
}

TEST(Generator, ListRejectsNegativeLength) {
    RandSource rand(23);
    auto gen = Gen::list(Gen::boolean(), Gen::constant<int64_t>(-1));
    EXPECT_THROW(gen(rand), MisuseError);
}

TEST(Generator, DictOverwritesDuplicateKeys) {
    RandSource rand(29);
    auto gen = Gen::dict(Gen::choose_value<std::string>({"a", "b"}), Gen::int_full(), Gen::int_range(6, 6));
    for (int i = 0; i < 20; i++) {
        OrderedMap<int64_t> m = gen(rand);
        EXPECT_GE(m.size(), 1u);
        EXPECT_LE(m.size(), 2u);
    }
}

TEST(Generator, DictWithDistinctKeysHasRequestedSize) {
    RandSource rand(31);
    auto gen = Gen::dict(Gen::printable_text(Gen::int_range(40, 40)), Gen::boolean(), Gen::int_range(5, 5));
    // 95^40 possible keys; a collision here would be astonishing.
    EXPECT_EQ(gen(rand).size(), 5u);
}

TEST(Generator, SameSeedSameValues) {
    auto gen = Gen::list(Gen::int_full(), Gen::int_range(0, 10));
    RandSource a(1234);
    RandSource b(1234);
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(gen(a), gen(b));
    }
}
