#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

#include "grid.hpp"
#include "parameters.hpp"
#include "random_stream.hpp"

// ---- Dirt State ---- //
// Side table: one flag per cell, row-major like Grid. Owned by the Model.
class DirtState {
private:
    int width{0}, height{0};

    std::vector<uint8_t> flags;   // 1 = dirty
    std::size_t dirty{0};

    std::size_t idx(const Cell& cell) const;

public:
    // Marks floor(size * dirty_percent / 100) cells dirty, drawn from rng.
    DirtState(const Grid& grid,
              int dirty_percent,
              RandomStream& rng,
              SamplingMode sampling = SamplingMode::WithoutReplacement);

    bool is_dirty(const Cell& cell) const;

    // No-op on a clean cell.
    void clean(const Cell& cell);

    std::size_t dirty_count() const noexcept { return dirty; }
    std::size_t total_cells() const noexcept { return flags.size(); }

    int getWidth() const noexcept { return width; }
    int getHeight() const noexcept { return height; }

    const std::vector<uint8_t>& raw() const noexcept { return flags; }
};
