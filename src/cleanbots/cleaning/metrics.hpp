#pragma once

#include <cstdint>
#include <utility>

#include "agent.hpp"
#include "model.hpp"

// Read-only surface for plotting and rendering. Safe at any point of a run.

// 100 * (1 - dirty / total), in [0,100].
double percent_clean(const Model& model);

// Sum of every cleaner's move counter.
std::int64_t total_moves(const Model& model);

AgentKind agent_kind(const Agent& agent);

std::pair<int, int> agent_position(const Agent& agent);
