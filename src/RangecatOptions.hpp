#pragma once
#include <cstdint>
#include <optional>
#include <string>

struct RangecatOptions {
    std::string configPath;
    std::string url;
    std::optional<uint64_t> length;
    uint64_t offset = 0;
    uint64_t count = 0;
    std::optional<uint64_t> segmentSize;
    std::optional<int> retryLimit;
    std::string outputPath;
    bool json = false;
    bool verbose = false;
};

void printUsage();

// Parses a non-negative decimal. Throws std::runtime_error naming flag.
uint64_t parseNumber(const std::string& flag, const std::string& value);

// Throws std::runtime_error on unknown options, bad numbers or a missing URL.
RangecatOptions parseArgs(int argc, char* argv[]);

bool isHttpUrl(const std::string& url);
