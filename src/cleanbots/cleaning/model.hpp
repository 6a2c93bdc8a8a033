#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

#include "agent.hpp"
#include "dirt_state.hpp"
#include "grid.hpp"
#include "parameters.hpp"
#include "random_stream.hpp"

// ---- Model Status ---- //
enum class ModelStatus : uint8_t {
    Running    = 0,
    Terminated = 1   // absorbing
};

// ---- Metrics Snapshot ---- //
struct MetricsSnapshot {
    int step{0};
    std::size_t dirty_count{0};
    double percent_clean{0.0};
    std::int64_t total_moves{0};
};

// ---- Model ---- //
// Owns the grid, the dirt table and the cleaners. Every tick activates all
// agents once, in an order reshuffled from the shared stream.
class Model {
private:
    Parameters params;
    RandomStream rng;

    Grid grid_;
    DirtState dirt_;
    std::vector<Agent> agents_;

    std::vector<std::size_t> order;   // activation permutation, reused
    int step_count{0};

    std::vector<MetricsSnapshot> series;

    void collect();
    void logTermination() const;

public:
    explicit Model(const Parameters& params);

    // No-op once terminated.
    void tick();

    // Ticks until terminated; returns the number of ticks executed.
    int run();

    ModelStatus status() const noexcept;
    bool running() const noexcept { return status() == ModelStatus::Running; }

    double percent_clean() const noexcept;
    std::int64_t total_moves() const noexcept;

    // ---- Accessors ---- //
    int current_step() const noexcept { return step_count; }
    int max_steps() const noexcept { return params.max_steps; }
    std::size_t dirty_count() const noexcept { return dirt_.dirty_count(); }
    std::uint64_t seed() const noexcept { return rng.seed(); }

    const Parameters& parameters() const noexcept { return params; }
    const Grid& grid() const noexcept { return grid_; }
    const DirtState& dirt() const noexcept { return dirt_; }
    const std::vector<Agent>& agents() const noexcept { return agents_; }

    // One entry for construction plus one per executed tick.
    const std::vector<MetricsSnapshot>& history() const noexcept { return series; }
};
