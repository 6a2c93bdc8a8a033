#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

// ---- Random Stream ---- //
// One seeded engine shared by dirt sampling, neighbor choice and
// activation shuffling. Passed explicitly; never global.
class RandomStream {
private:
    std::uint64_t seed_{0};
    std::mt19937_64 rng;

public:
    explicit RandomStream(std::uint64_t seed);

    // Seeds from std::random_device; the drawn seed is kept for replay.
    RandomStream();

    std::uint64_t seed() const noexcept { return seed_; }

    // Uniform integer in [0, n). n must be positive.
    std::size_t below(std::size_t n);

    // Fisher-Yates over the whole range.
    template <typename T>
    void shuffle(std::vector<T>& items)
    {
        for (std::size_t i = items.size(); i > 1; --i)
        {
            const std::size_t j = below(i);
            std::swap(items[i - 1], items[j]);
        }
    }

    // k distinct indices from [0, population), k <= population.
    std::vector<std::size_t> sample(std::size_t population, std::size_t k);

    // k indices from [0, population), repeats allowed.
    std::vector<std::size_t> choices(std::size_t population, std::size_t k);
};
