#include "StreamCopy.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

uint64_t copyStream(SegmentedRangeStream& stream, std::ostream& out, size_t bufferSize,
                    std::function<void(double)> progress, const CancellationToken* token, uint64_t maxBytes) {
    if (bufferSize == 0) {
        throw std::invalid_argument("Copy buffer size must be positive");
    }
    std::vector<char> buffer(bufferSize);
    uint64_t copied = 0;

    while (maxBytes == 0 || copied < maxBytes) {
        size_t want = bufferSize;
        if (maxBytes != 0) {
            want = static_cast<size_t>(std::min<uint64_t>(want, maxBytes - copied));
        }
        size_t n = stream.read(buffer.data(), want, token);
        if (n == 0) {
            break;
        }
        out.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!out) {
            throw std::runtime_error("Failed to write to output stream");
        }
        copied += n;
        if (progress && stream.length() > 0) {
            progress(std::min(1.0, static_cast<double>(stream.position()) / static_cast<double>(stream.length())));
        }
    }

    if (progress) {
        progress(1.0);
    }
    return copied;
}
