#include "dirt_state.hpp"
#include "errors.hpp"

#include <string>

DirtState::DirtState(const Grid& grid,
                     int dirty_percent,
                     RandomStream& rng,
                     SamplingMode sampling)
    : width(grid.getWidth()),
      height(grid.getHeight()),
      flags(grid.size(), 0)
{
    if (dirty_percent < 0 || dirty_percent > 100)
        throw InvalidConfigurationError(
            "dirty_percent must be in [0,100], got " + std::to_string(dirty_percent));

    const std::size_t total = flags.size();
    const std::size_t num_dirty =
        total * static_cast<std::size_t>(dirty_percent) / 100;

    const std::vector<std::size_t> picked =
        sampling == SamplingMode::WithReplacement
            ? rng.choices(total, num_dirty)
            : rng.sample(total, num_dirty);

    for (std::size_t k : picked)
    {
        if (flags[k]) continue;
        flags[k] = 1;
        ++dirty;
    }
}

std::size_t DirtState::idx(const Cell& cell) const
{
    if (cell.x < 0 || cell.y < 0 || cell.x >= width || cell.y >= height)
        throw OutOfRangeError("cell (" + std::to_string(cell.x) + ", "
                              + std::to_string(cell.y) + ") has no dirt entry");

    return static_cast<std::size_t>(cell.y) * static_cast<std::size_t>(width)
         + static_cast<std::size_t>(cell.x);
}

bool DirtState::is_dirty(const Cell& cell) const
{
    return flags[idx(cell)] != 0;
}

void DirtState::clean(const Cell& cell)
{
    const std::size_t k = idx(cell);
    if (!flags[k]) return;

    flags[k] = 0;
    --dirty;
}
