#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "metrics.hpp"
#include "model.hpp"

namespace {

void printUsage()
{
    std::cerr << "Usage:\n"
              << "  cleaning_sim [--verbose] n width height dirty_percent max_steps"
              << " [seed] [final_grid.txt] [metrics.csv]\n";
}

// One row per grid row, 1 = still dirty.
bool saveGrid(const Model& model, const std::string& filename)
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        spdlog::error("Error opening file for writing: {}", filename);
        return false;
    }

    const DirtState& dirt = model.dirt();
    for (int y = 0; y < dirt.getHeight(); ++y)
    {
        for (int x = 0; x < dirt.getWidth(); ++x)
        {
            file << (dirt.is_dirty(Cell{x, y}) ? 1 : 0);
            if (x < dirt.getWidth() - 1)
                file << " ";
        }
        file << "\n";
    }

    spdlog::info("Saved final grid to: {}", filename);
    return true;
}

bool saveMetrics(const Model& model, const std::string& filename)
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        spdlog::error("Error opening file for writing: {}", filename);
        return false;
    }

    file << "step,percent_clean,total_moves,dirty_count\n";
    for (const MetricsSnapshot& s : model.history())
        file << s.step << "," << s.percent_clean << "," << s.total_moves << "," << s.dirty_count << "\n";

    spdlog::info("Saved metrics to: {}", filename);
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    int first = 1;
    spdlog::set_level(spdlog::level::info);
    if (argc > 1 && std::strcmp(argv[1], "--verbose") == 0)
    {
        spdlog::set_level(spdlog::level::debug);
        ++first;
    }

    const int given = argc - first;
    if (given < 5)
    {
        printUsage();
        return 1;
    }

    Parameters params;
    std::string output_grid = "final_grid.txt";
    std::string output_metrics;

    try
    {
        params.n             = parse_int("n", argv[first + 0]);
        params.width         = parse_int("width", argv[first + 1]);
        params.height        = parse_int("height", argv[first + 2]);
        params.dirty_percent = parse_int("dirty_percent", argv[first + 3]);
        params.max_steps     = parse_int("max_steps", argv[first + 4]);
        if (given >= 6)
            params.seed = parse_seed(argv[first + 5]);
    }
    catch (const InvalidConfigurationError& e)
    {
        spdlog::error("Bad numeric argument: {}", e.what());
        printUsage();
        return 1;
    }

    if (given >= 7)
        output_grid = argv[first + 6];
    if (given >= 8)
        output_metrics = argv[first + 7];

    try
    {
        Model model(params);
        spdlog::info("Running cleaning simulation: {}", describe(model.parameters()));

        const int ticks = model.run();

        spdlog::info("Finished after {} steps: {:.2f}% clean, {} moves",
                     ticks, percent_clean(model), total_moves(model));

        if (!saveGrid(model, output_grid))
            return 1;
        if (!output_metrics.empty() && !saveMetrics(model, output_metrics))
            return 1;
    }
    catch (const InvalidConfigurationError& e)
    {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    return 0;
}
