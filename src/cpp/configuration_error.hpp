#pragma once

#include <stdexcept>
#include <string>

// Raised when a menu description cannot be turned into a node tree
// (reference cycles, unknown menu names, depth or size limits)
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what)
    {}
};
