#include "random_stream.hpp"

#include <numeric>
#include <stdexcept>

namespace {

std::uint64_t fresh_seed()
{
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

} // namespace

RandomStream::RandomStream(std::uint64_t seed)
    : seed_(seed),
      rng(seed)
{
}

RandomStream::RandomStream()
    : RandomStream(fresh_seed())
{
}

std::size_t RandomStream::below(std::size_t n)
{
    if (n == 0)
        throw std::invalid_argument("below() needs a non-empty range");

    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(rng);
}

std::vector<std::size_t> RandomStream::sample(std::size_t population, std::size_t k)
{
    if (k > population)
        throw std::invalid_argument("sample larger than population");

    std::vector<std::size_t> pool(population);
    std::iota(pool.begin(), pool.end(), std::size_t{0});

    // partial Fisher-Yates: the first k slots end up as the sample
    for (std::size_t i = 0; i < k; ++i)
    {
        const std::size_t j = i + below(population - i);
        std::swap(pool[i], pool[j]);
    }

    pool.resize(k);
    return pool;
}

std::vector<std::size_t> RandomStream::choices(std::size_t population, std::size_t k)
{
    if (population == 0 && k > 0)
        throw std::invalid_argument("choices from an empty population");

    std::vector<std::size_t> out;
    out.reserve(k);
    for (std::size_t i = 0; i < k; ++i)
        out.push_back(below(population));
    return out;
}
