#include "model.hpp"

#include <numeric>

#include <spdlog/spdlog.h>

namespace {

const Parameters& checked(const Parameters& p)
{
    validate(p);
    return p;
}

RandomStream makeStream(const Parameters& p)
{
    return p.seed ? RandomStream(*p.seed) : RandomStream();
}

} // namespace

Model::Model(const Parameters& p)
    : params(checked(p)),
      rng(makeStream(params)),
      grid_(params.width, params.height, params.torus),
      dirt_(grid_, params.dirty_percent, rng, params.sampling),
      order(static_cast<std::size_t>(params.n))
{
    if (!params.seed)
        params.seed = rng.seed();

    // every cleaner starts in the corner
    const Cell start = grid_.cell_at(0, 0);
    agents_.reserve(static_cast<std::size_t>(params.n));
    for (int i = 0; i < params.n; ++i)
        agents_.emplace_back(static_cast<std::size_t>(i), start);

    spdlog::debug("Cleaning model: {} ({} of {} cells dirty)",
                  describe(params), dirt_.dirty_count(), dirt_.total_cells());

    collect();

    if (!running())
        logTermination();
}

void Model::tick()
{
    if (step_count >= params.max_steps) return;
    if (dirt_.dirty_count() == 0) return;

    std::iota(order.begin(), order.end(), std::size_t{0});
    rng.shuffle(order);

    // agents see dirt already cleaned earlier in the same tick
    for (std::size_t k : order)
        agents_[k].step(dirt_, grid_, rng);

    ++step_count;
    collect();

    if (!running())
        logTermination();
}

int Model::run()
{
    const int start = step_count;
    while (running())
        tick();
    return step_count - start;
}

ModelStatus Model::status() const noexcept
{
    if (step_count >= params.max_steps || dirt_.dirty_count() == 0)
        return ModelStatus::Terminated;
    return ModelStatus::Running;
}

double Model::percent_clean() const noexcept
{
    const double total = static_cast<double>(dirt_.total_cells());
    return 100.0 * (1.0 - static_cast<double>(dirt_.dirty_count()) / total);
}

std::int64_t Model::total_moves() const noexcept
{
    std::int64_t sum = 0;
    for (const Agent& a : agents_)
        sum += a.moves();
    return sum;
}

void Model::collect()
{
    MetricsSnapshot s;
    s.step = step_count;
    s.dirty_count = dirt_.dirty_count();
    s.percent_clean = percent_clean();
    s.total_moves = total_moves();
    series.push_back(s);
}

void Model::logTermination() const
{
    if (dirt_.dirty_count() == 0)
        spdlog::debug("Grid clean after {} steps, {} moves", step_count, total_moves());
    else
        spdlog::debug("Step budget {} exhausted at {:.1f}% clean, {} moves",
                      params.max_steps, percent_clean(), total_moves());
}
