#include "grid.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string>

Grid::Grid(int w, int h, bool torus)
    : width(w),
      height(h),
      wrap(torus)
{
    if (width <= 0 || height <= 0)
        throw InvalidConfigurationError("Grid must be non-empty");

    cells.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x)
            cells.push_back(Cell{x, y});

    adjacency.reserve(cells.size());
    for (const Cell& c : cells)
        adjacency.push_back(computeNeighbors(c.x, c.y));
}

std::vector<Cell> Grid::computeNeighbors(int x, int y) const
{
    std::vector<Cell> out;
    out.reserve(8);

    for (int dy = -1; dy <= 1; ++dy)
    for (int dx = -1; dx <= 1; ++dx)
    {
        if (dx == 0 && dy == 0) continue;

        int nx = x + dx;
        int ny = y + dy;

        if (wrap)
        {
            nx = (nx % width + width) % width;
            ny = (ny % height + height) % height;

            // narrow tori fold neighbors onto each other or onto the cell itself
            if (nx == x && ny == y) continue;
            const Cell c{nx, ny};
            if (std::find(out.begin(), out.end(), c) != out.end()) continue;
            out.push_back(c);
        }
        else if (contains(nx, ny))
        {
            out.push_back(Cell{nx, ny});
        }
    }

    return out;
}

Cell Grid::cell_at(int x, int y) const
{
    return cells[index_of(Cell{x, y})];
}

std::size_t Grid::index_of(const Cell& cell) const
{
    if (!contains(cell.x, cell.y))
        throw OutOfRangeError("cell (" + std::to_string(cell.x) + ", " + std::to_string(cell.y)
                              + ") outside " + std::to_string(width) + "x"
                              + std::to_string(height) + " grid");
    return idx(cell.x, cell.y);
}

const std::vector<Cell>& Grid::neighbors(const Cell& cell) const
{
    return adjacency[index_of(cell)];
}
