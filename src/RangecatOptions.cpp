#include "RangecatOptions.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

void printUsage() {
    std::cerr << "Usage: rangecat [--config FILE] [--offset N] [--count N] [--segment-size N]\n"
                 "                [--retry-limit N] [--output FILE] [--json] [--verbose] URL [LENGTH]\n"
                 "\n"
                 "Streams URL (http, https, file:// or a local path) in byte-range segments.\n"
                 "LENGTH is required for http(s) URLs and defaults to the file size otherwise.\n";
}

uint64_t parseNumber(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        uint64_t n = std::stoull(value, &used);
        if (used != value.size() || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        return n;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
}

RangecatOptions parseArgs(int argc, char* argv[]) {
    RangecatOptions opts;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            return argv[++i];
        };
        if (arg == "--config") {
            opts.configPath = next();
        } else if (arg == "--offset") {
            opts.offset = parseNumber(arg, next());
        } else if (arg == "--count") {
            opts.count = parseNumber(arg, next());
        } else if (arg == "--segment-size") {
            opts.segmentSize = parseNumber(arg, next());
        } else if (arg == "--retry-limit") {
            std::string value = next();
            uint64_t limit = parseNumber(arg, value);
            if (limit > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                throw std::runtime_error("Invalid value for " + arg + ": " + value);
            }
            opts.retryLimit = static_cast<int>(limit);
        } else if (arg == "--output" || arg == "-o") {
            opts.outputPath = next();
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            throw std::runtime_error("Unknown option: " + arg);
        } else if (positional == 0) {
            opts.url = arg;
            ++positional;
        } else if (positional == 1) {
            opts.length = parseNumber("LENGTH", arg);
            ++positional;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
    if (opts.url.empty()) {
        throw std::runtime_error("Missing URL");
    }
    return opts;
}

bool isHttpUrl(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}
