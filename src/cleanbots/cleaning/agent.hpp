#pragma once

#include <cstddef>
#include <cstdint>

#include "grid.hpp"
#include "dirt_state.hpp"
#include "random_stream.hpp"

// ---- Agent Kinds ---- //
enum class AgentKind : uint8_t {
    Cleaner = 0
};

// ---- Agent ---- //
// Reactive cleaning robot: cleans its cell if dirty, otherwise steps to a
// uniformly random Moore neighbor. No memory of visited cells.
class Agent {
private:
    std::size_t agent_id{0};
    Cell current;
    std::int64_t move_count{0};

public:
    Agent(std::size_t id, const Cell& start);

    void step(DirtState& dirt, const Grid& grid, RandomStream& rng);

    // ---- Accessors ---- //
    std::size_t id() const noexcept { return agent_id; }
    const Cell& cell() const noexcept { return current; }
    std::int64_t moves() const noexcept { return move_count; }
    AgentKind kind() const noexcept { return AgentKind::Cleaner; }
};
