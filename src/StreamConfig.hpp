#pragma once
#include <cstdint>
#include <string>
#include <json/json.h>

// Tunables shared by the stream, the HTTP fetcher and rangecat.
struct StreamConfig {
    uint64_t segmentSize = 10 * 1024 * 1024;
    int retryLimit = 5;
    double timeoutSeconds = 30.0;
    std::string userAgent = "rangestream/1.0";
    size_t bufferSize = 81920;

    // Overlays the keys present in json onto this config. Unknown keys are
    // ignored; bad values throw std::runtime_error naming the key.
    void apply(const Json::Value& json);

    void loadFromFile(const std::string& path);
    void loadFromString(const std::string& text);

    Json::Value toJson() const;
};
