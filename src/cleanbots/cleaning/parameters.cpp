#include "parameters.hpp"
#include "errors.hpp"

#include <sstream>
#include <stdexcept>

void validate(const Parameters& p)
{
    if (p.n <= 0)
        throw InvalidConfigurationError("n must be positive, got " + std::to_string(p.n));

    if (p.width <= 0)
        throw InvalidConfigurationError("width must be positive, got " + std::to_string(p.width));

    if (p.height <= 0)
        throw InvalidConfigurationError("height must be positive, got " + std::to_string(p.height));

    if (p.dirty_percent < 0 || p.dirty_percent > 100)
        throw InvalidConfigurationError(
            "dirty_percent must be in [0,100], got " + std::to_string(p.dirty_percent));

    if (p.max_steps <= 0)
        throw InvalidConfigurationError(
            "max_steps must be positive, got " + std::to_string(p.max_steps));
}

std::string describe(const Parameters& p)
{
    std::ostringstream os;
    os << "n=" << p.n
       << " grid=" << p.width << "x" << p.height
       << " dirty=" << p.dirty_percent << "%"
       << " max_steps=" << p.max_steps
       << " torus=" << (p.torus ? "yes" : "no")
       << " sampling="
       << (p.sampling == SamplingMode::WithReplacement ? "with-replacement"
                                                       : "without-replacement");
    if (p.seed)
        os << " seed=" << *p.seed;
    return os.str();
}

int parse_int(const std::string& field, const std::string& text)
{
    std::size_t pos = 0;
    int value = 0;
    try
    {
        value = std::stoi(text, &pos);
    }
    catch (const std::logic_error&)
    {
        throw InvalidConfigurationError(field + " is not an integer: '" + text + "'");
    }

    if (pos != text.size())
        throw InvalidConfigurationError(field + " has trailing characters: '" + text + "'");
    return value;
}

std::uint64_t parse_seed(const std::string& text)
{
    // stoull would wrap "-5" around to a huge value
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        throw InvalidConfigurationError("seed must be a non-negative integer: '" + text + "'");

    try
    {
        return std::stoull(text);
    }
    catch (const std::out_of_range&)
    {
        throw InvalidConfigurationError("seed does not fit in 64 bits: '" + text + "'");
    }
}
