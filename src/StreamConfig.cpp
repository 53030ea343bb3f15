#include "StreamConfig.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

Json::Value parseJson(std::istream& in, const std::string& origin) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw std::runtime_error("Invalid config " + origin + ": " + errs);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config " + origin + " must be a JSON object");
    }
    return root;
}

uint64_t positiveUInt(const Json::Value& json, const char* key) {
    const Json::Value& v = json[key];
    if (!v.isIntegral() || (v.isInt64() && v.asInt64() <= 0)) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be a positive integer");
    }
    return v.asUInt64();
}

} // namespace

void StreamConfig::apply(const Json::Value& json) {
    if (json.isMember("segment_size")) {
        segmentSize = positiveUInt(json, "segment_size");
    }
    if (json.isMember("retry_limit")) {
        const Json::Value& v = json["retry_limit"];
        if (!v.isInt() || v.asInt() < 0) {
            throw std::runtime_error("Config key 'retry_limit' must be a non-negative integer");
        }
        retryLimit = v.asInt();
    }
    if (json.isMember("timeout_seconds")) {
        const Json::Value& v = json["timeout_seconds"];
        if (!v.isNumeric() || v.asDouble() <= 0) {
            throw std::runtime_error("Config key 'timeout_seconds' must be a positive number");
        }
        timeoutSeconds = v.asDouble();
    }
    if (json.isMember("user_agent")) {
        const Json::Value& v = json["user_agent"];
        if (!v.isString()) {
            throw std::runtime_error("Config key 'user_agent' must be a string");
        }
        userAgent = v.asString();
    }
    if (json.isMember("buffer_size")) {
        bufferSize = static_cast<size_t>(positiveUInt(json, "buffer_size"));
    }
}

void StreamConfig::loadFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    apply(parseJson(ifs, path));
}

void StreamConfig::loadFromString(const std::string& text) {
    std::istringstream iss(text);
    apply(parseJson(iss, "string"));
}

Json::Value StreamConfig::toJson() const {
    Json::Value json;
    json["segment_size"] = (Json::UInt64)segmentSize;
    json["retry_limit"] = retryLimit;
    json["timeout_seconds"] = timeoutSeconds;
    json["user_agent"] = userAgent;
    json["buffer_size"] = (Json::UInt64)bufferSize;
    return json;
}
