#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <vector>

#include "parameters.hpp"

// ---- Batch Result ---- //
// Rows are runs (one per seed), columns are steps 0..max_steps. A row is
// padded with its last value once that run has terminated.
struct BatchResult {
    std::vector<std::uint64_t> seeds;
    Eigen::MatrixXd percent_clean;
    Eigen::MatrixXd total_moves;
    Eigen::VectorXi steps_to_clean;   // -1 when the budget ran out first
};

struct BatchSummary {
    Eigen::VectorXd mean_percent_clean;
    Eigen::VectorXd var_percent_clean;   // unbiased, zero for a single run
    Eigen::VectorXd mean_total_moves;
    double mean_steps_to_clean{0.0};     // over runs that finished; NaN if none did
    double clean_fraction{0.0};
};

// Runs one model per seed, sequentially. base.seed is ignored.
BatchResult run_batch(const Parameters& base, const std::vector<std::uint64_t>& seeds);

BatchSummary summarize(const BatchResult& batch);
