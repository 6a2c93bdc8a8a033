#include "agent.hpp"

Agent::Agent(std::size_t id, const Cell& start)
    : agent_id(id),
      current(start)
{
}

void Agent::step(DirtState& dirt, const Grid& grid, RandomStream& rng)
{
    if (dirt.is_dirty(current))
    {
        dirt.clean(current);
        return;
    }

    const std::vector<Cell>& options = grid.neighbors(current);
    if (options.empty()) return;   // 1x1 grid

    current = options[rng.below(options.size())];
    ++move_count;
}
