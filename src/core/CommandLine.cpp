#include "core/CommandLine.hpp"
#include <cstdlib>
#include <stdexcept>

namespace podfetch {
namespace core {

namespace {

int parseCount(const std::string& option, const std::string& value) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a whole number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(option + " expects a whole number, got '" + value + "'");
    }
    return n;
}

double parseSeconds(const std::string& option, const std::string& value) {
    size_t used = 0;
    double seconds = 0;
    try {
        seconds = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number of seconds, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(option + " expects a number of seconds, got '" + value + "'");
    }
    return seconds;
}

} // namespace

std::string defaultConfdir() {
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/.podfetch";
}

Options parseArguments(const std::vector<std::string>& args) {
    Options opts;
    opts.confdir = defaultConfdir();

    auto needValue = [&](size_t& i, const std::string& arg) -> std::string {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("option " + arg + " requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.commands = {"help"};
            return opts;
        } else if (arg == "-c" || arg == "--confdir") {
            opts.confdir = needValue(i, arg);
        } else if (arg == "-d" || arg == "--downloads") {
            opts.downloads = parseCount(arg, needValue(i, arg));
            if (opts.downloads < 1) {
                throw std::invalid_argument(arg + " must be at least 1");
            }
        } else if (arg == "-t" || arg == "--timeout") {
            opts.timeout = parseSeconds(arg, needValue(i, arg));
            if (!(opts.timeout > 0)) {
                throw std::invalid_argument(arg + " must be positive");
            }
        } else if (arg == "-r" || arg == "--refresh") {
            opts.refresh = true;
        } else if (arg == "-s" || arg == "--sed") {
            opts.sed = needValue(i, arg);
        } else if (arg == "-p" || arg == "--probe") {
            opts.probe = needValue(i, arg);
        } else if (arg == "--verbose") {
            ++opts.verbose;
        } else if (arg.size() > 1 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos) {
            opts.verbose += static_cast<int>(arg.size() - 1);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            opts.commands.push_back(arg);
        }
    }
    return opts;
}

Options parseArguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseArguments(args);
}

} // namespace core
} // namespace podfetch
