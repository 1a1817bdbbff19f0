#pragma once

#include <optional>
#include <string>
#include <vector>

namespace podfetch {
namespace core {

struct Options {
    std::string confdir;
    int downloads = 0;          // 0 = take it from the configuration
    double timeout = 5.0;
    bool refresh = false;
    int verbose = 0;
    std::optional<std::string> sed;
    std::optional<std::string> probe;
    std::vector<std::string> commands;
};

// $HOME/.podfetch
std::string defaultConfdir();

// Throws std::invalid_argument on bad usage, naming the offending option
Options parseArguments(const std::vector<std::string>& args);
Options parseArguments(int argc, char* argv[]);

} // namespace core
} // namespace podfetch
