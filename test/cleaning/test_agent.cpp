#include <gtest/gtest.h>

#include <algorithm>

#include "agent.hpp"
#include "dirt_state.hpp"
#include "grid.hpp"
#include "metrics.hpp"
#include "random_stream.hpp"

TEST(AgentTest, StartsAtGivenCellWithoutMoves) {
    Agent agent(3, Cell{0, 0});
    EXPECT_EQ(agent.id(), 3u);
    EXPECT_EQ(agent.cell(), (Cell{0, 0}));
    EXPECT_EQ(agent.moves(), 0);
    EXPECT_EQ(agent.kind(), AgentKind::Cleaner);
}

TEST(AgentTest, CleansDirtyCellInsteadOfMoving) {
    Grid grid(3, 3);
    RandomStream rng(5);
    DirtState dirt(grid, 100, rng);
    Agent agent(0, Cell{1, 1});

    agent.step(dirt, grid, rng);

    EXPECT_FALSE(dirt.is_dirty(Cell{1, 1}));
    EXPECT_EQ(dirt.dirty_count(), 8u);
    EXPECT_EQ(agent.cell(), (Cell{1, 1}));
    EXPECT_EQ(agent.moves(), 0);
}

TEST(AgentTest, MovesToNeighborOnCleanCell) {
    Grid grid(3, 3);
    RandomStream rng(5);
    DirtState dirt(grid, 0, rng);
    Agent agent(0, Cell{0, 0});

    agent.step(dirt, grid, rng);

    const auto& options = grid.neighbors(Cell{0, 0});
    EXPECT_NE(std::find(options.begin(), options.end(), agent.cell()), options.end());
    EXPECT_EQ(agent.moves(), 1);
    EXPECT_EQ(dirt.dirty_count(), 0u);
}

TEST(AgentTest, MoveCounterNeverDecreases) {
    Grid grid(4, 4);
    RandomStream rng(6);
    DirtState dirt(grid, 50, rng);
    Agent agent(0, Cell{0, 0});

    std::int64_t last = 0;
    for (int i = 0; i < 40; ++i)
    {
        agent.step(dirt, grid, rng);
        EXPECT_GE(agent.moves(), last);
        EXPECT_LE(agent.moves(), last + 1);
        last = agent.moves();
        EXPECT_TRUE(grid.contains(agent.cell().x, agent.cell().y));
    }
}

TEST(AgentTest, StaysPutOnSingleCellGrid) {
    Grid grid(1, 1);
    RandomStream rng(2);
    DirtState dirt(grid, 100, rng);
    Agent agent(0, Cell{0, 0});

    agent.step(dirt, grid, rng);
    EXPECT_EQ(dirt.dirty_count(), 0u);

    agent.step(dirt, grid, rng);
    agent.step(dirt, grid, rng);
    EXPECT_EQ(agent.cell(), (Cell{0, 0}));
    EXPECT_EQ(agent.moves(), 0);
}

TEST(AgentTest, ReadSurfaceReportsKindAndPosition) {
    Agent agent(1, Cell{4, 2});
    EXPECT_EQ(agent_kind(agent), AgentKind::Cleaner);
    EXPECT_EQ(agent_position(agent), std::make_pair(4, 2));
}
