#include "batch_run.hpp"

#include "errors.hpp"
#include "model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

/* ------------------ run_batch ------------------ */
BatchResult run_batch(const Parameters& base, const std::vector<std::uint64_t>& seeds)
{
    if (seeds.empty())
        throw InvalidConfigurationError("run_batch needs at least one seed");

    validate(base);

    const int runs = static_cast<int>(seeds.size());
    const int cols = base.max_steps + 1;

    BatchResult out;
    out.seeds = seeds;
    out.percent_clean.resize(runs, cols);
    out.total_moves.resize(runs, cols);
    out.steps_to_clean = Eigen::VectorXi::Constant(runs, -1);

    for (int r = 0; r < runs; ++r)
    {
        Parameters p = base;
        p.seed = seeds[r];

        Model model(p);
        model.run();

        const auto& series = model.history();
        for (int c = 0; c < cols; ++c)
        {
            // hold the final snapshot past termination
            const std::size_t k = std::min<std::size_t>(c, series.size() - 1);
            out.percent_clean(r, c) = series[k].percent_clean;
            out.total_moves(r, c)   = static_cast<double>(series[k].total_moves);
        }

        if (model.dirty_count() == 0)
            out.steps_to_clean(r) = model.current_step();

        spdlog::debug("batch run {}/{} seed={} steps={} clean={:.1f}%",
                      r + 1, runs, seeds[r], model.current_step(), model.percent_clean());
    }

    return out;
}

/* ------------------ summarize ------------------ */
BatchSummary summarize(const BatchResult& batch)
{
    const Eigen::Index n = batch.percent_clean.rows();
    if (n == 0)
        throw InvalidConfigurationError("cannot summarize an empty batch");

    BatchSummary s;

    const Eigen::RowVectorXd mean = batch.percent_clean.colwise().mean();
    s.mean_percent_clean = mean.transpose();
    s.mean_total_moves = batch.total_moves.colwise().mean().transpose();

    if (n > 1)
    {
        const Eigen::MatrixXd centered = batch.percent_clean.rowwise() - mean;
        s.var_percent_clean =
            (centered.array().square().colwise().sum() / static_cast<double>(n - 1)).matrix().transpose();
    }
    else
    {
        s.var_percent_clean = Eigen::VectorXd::Zero(batch.percent_clean.cols());
    }

    double sum = 0.0;
    int finished = 0;
    for (Eigen::Index r = 0; r < n; ++r)
    {
        if (batch.steps_to_clean(r) < 0) continue;
        sum += batch.steps_to_clean(r);
        ++finished;
    }

    s.clean_fraction = static_cast<double>(finished) / static_cast<double>(n);
    s.mean_steps_to_clean = finished > 0
        ? sum / finished
        : std::numeric_limits<double>::quiet_NaN();

    return s;
}
