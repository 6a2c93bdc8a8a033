#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <set>
#include <stdexcept>
#include <vector>

#include "random_stream.hpp"

TEST(RandomStreamTest, SameSeedSameSequence) {
    RandomStream a(2024);
    RandomStream b(2024);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(a.below(1000), b.below(1000));
}

TEST(RandomStreamTest, BelowStaysInRange) {
    RandomStream rng(1);
    for (int i = 0; i < 1000; ++i)
        EXPECT_LT(rng.below(7), 7u);
    EXPECT_EQ(rng.below(1), 0u);
    EXPECT_THROW(rng.below(0), std::invalid_argument);
}

TEST(RandomStreamTest, KnownDrawsForSeed) {
    // regression baseline for mt19937_64 + libstdc++ uniform_int_distribution
    RandomStream rng(7);
    const std::vector<std::size_t> expected = {7, 9, 1, 8, 1};
    std::vector<std::size_t> got;
    for (int i = 0; i < 5; ++i)
        got.push_back(rng.below(10));
    EXPECT_EQ(got, expected);
}

TEST(RandomStreamTest, SampleIsDistinct) {
    RandomStream rng(3);
    const auto picked = rng.sample(100, 37);
    ASSERT_EQ(picked.size(), 37u);

    std::set<std::size_t> unique(picked.begin(), picked.end());
    EXPECT_EQ(unique.size(), 37u);
    EXPECT_LT(*unique.rbegin(), 100u);

    EXPECT_THROW(rng.sample(3, 4), std::invalid_argument);
}

TEST(RandomStreamTest, SampleWholePopulation) {
    RandomStream rng(5);
    auto picked = rng.sample(10, 10);
    std::sort(picked.begin(), picked.end());
    std::vector<std::size_t> all(10);
    std::iota(all.begin(), all.end(), std::size_t{0});
    EXPECT_EQ(picked, all);
}

TEST(RandomStreamTest, ChoicesMayRepeat) {
    RandomStream rng(9);
    const auto picked = rng.choices(2, 50);
    ASSERT_EQ(picked.size(), 50u);
    std::set<std::size_t> unique(picked.begin(), picked.end());
    EXPECT_LE(unique.size(), 2u);
}

TEST(RandomStreamTest, ShuffleIsPermutation) {
    RandomStream rng(11);
    std::vector<int> items(20);
    std::iota(items.begin(), items.end(), 0);

    rng.shuffle(items);

    std::vector<int> sorted = items;
    std::sort(sorted.begin(), sorted.end());
    std::vector<int> expected(20);
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(sorted, expected);
}

TEST(RandomStreamTest, UnseededKeepsDrawnSeed) {
    RandomStream a;
    RandomStream b(a.seed());
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(a.below(1u << 20), b.below(1u << 20));
}
