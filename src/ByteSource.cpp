#include "ByteSource.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

MemoryByteSource::MemoryByteSource(std::string bytes) : data(std::move(bytes)) {}

size_t MemoryByteSource::read(char* buffer, size_t count) {
    size_t n = std::min(count, data.size() - offset);
    if (n > 0) {
        std::memcpy(buffer, data.data() + offset, n);
        offset += n;
    }
    return n;
}
