#pragma once
#include <cstddef>
#include <string>

// Forward-only source of bytes for one fetched range.
// read() returns 0 at the end of the source and throws TransientFetchError
// if the underlying transfer breaks off.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(char* buffer, size_t count) = 0;
};

// Hands out an owned byte string (e.g. an HTTP response body) sequentially.
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string bytes);

    size_t read(char* buffer, size_t count) override;
    size_t remaining() const { return data.size() - offset; }

private:
    std::string data;
    size_t offset = 0;
};
