#pragma once
#include <stdexcept>
#include <string>

// Permanent fetch failure (bad URL, 4xx status, missing file). Not retried.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& msg) : std::runtime_error(msg) {}
};

// A single attempt to open or read a segment failed. The stream retries these.
class TransientFetchError : public std::runtime_error {
public:
    explicit TransientFetchError(const std::string& msg) : std::runtime_error(msg) {}
};

class SegmentFetchExhausted : public std::runtime_error {
public:
    SegmentFetchExhausted(const std::string& msg, int attempts)
        : std::runtime_error(msg), attemptCount(attempts) {}

    int attempts() const { return attemptCount; }

private:
    int attemptCount;
};

class InvalidPosition : public std::runtime_error {
public:
    explicit InvalidPosition(const std::string& msg) : std::runtime_error(msg) {}
};

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

class NotSupported : public std::runtime_error {
public:
    explicit NotSupported(const std::string& msg) : std::runtime_error(msg) {}
};
