#pragma once

#include <vector>
#include <cstddef>

// ---- Cell ---- //
struct Cell {
    int x{0};
    int y{0};

    bool operator==(const Cell& o) const noexcept { return x == o.x && y == o.y; }
    bool operator!=(const Cell& o) const noexcept { return !(*this == o); }
};

// ---- Grid ---- //
// Fixed width x height lattice with Moore (8-connected) adjacency.
// Bounded unless built with torus = true. Immutable once constructed.
class Grid {
private:
    int width{0}, height{0};
    bool wrap{false};

    // row-major: index = y * width + x
    std::vector<Cell> cells;
    std::vector<std::vector<Cell>> adjacency;

    inline std::size_t idx(int x, int y) const {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width)
             + static_cast<std::size_t>(x);
    }

    std::vector<Cell> computeNeighbors(int x, int y) const;

public:
    Grid(int width, int height, bool torus = false);

    bool contains(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    // Throws OutOfRangeError outside the grid.
    Cell cell_at(int x, int y) const;
    std::size_t index_of(const Cell& cell) const;

    // Fixed order: dy outer, dx inner, both from -1 to 1.
    const std::vector<Cell>& neighbors(const Cell& cell) const;

    const std::vector<Cell>& all_cells() const noexcept { return cells; }

    // ---- Accessors ---- //
    int getWidth() const noexcept { return width; }
    int getHeight() const noexcept { return height; }
    bool torus() const noexcept { return wrap; }
    std::size_t size() const noexcept { return cells.size(); }
};
