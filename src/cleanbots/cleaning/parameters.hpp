#pragma once

#include <cstdint>
#include <optional>
#include <string>

// ---- Dirt Sampling ---- //
enum class SamplingMode : uint8_t {
    WithoutReplacement = 0,   // exact requested dirty count
    WithReplacement    = 1    // repeated draws may land on the same cell
};

// ---- Parameters ---- //
struct Parameters {
    int n{5};
    int width{10};
    int height{10};
    int dirty_percent{100};
    int max_steps{200};
    std::optional<std::uint64_t> seed;
    bool torus{false};
    SamplingMode sampling{SamplingMode::WithoutReplacement};
};

// Throws InvalidConfigurationError naming the first bad field.
void validate(const Parameters& params);

std::string describe(const Parameters& params);

// Whole-string integer parsing for command line values. Trailing characters,
// overflow and (for seeds) a sign are rejected with InvalidConfigurationError.
int parse_int(const std::string& field, const std::string& text);
std::uint64_t parse_seed(const std::string& text);
