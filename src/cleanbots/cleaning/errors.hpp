#pragma once

#include <stdexcept>
#include <string>

// Bad construction parameters; the simulation never starts.
class InvalidConfigurationError : public std::invalid_argument {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Cell lookup outside [0,width) x [0,height).
class OutOfRangeError : public std::out_of_range {
public:
    explicit OutOfRangeError(const std::string& what)
        : std::out_of_range(what) {}
};
