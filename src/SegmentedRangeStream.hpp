#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "ByteSource.hpp"
#include "CancellationToken.hpp"
#include "RangeFetcher.hpp"

enum class SeekOrigin { Begin, Current, End };

// Read-only, seekable stream over a remote resource that is fetched in
// bounded byte ranges of at most segmentSize bytes. Only one segment is open
// at a time; it is opened lazily by read() and dropped on seek, close or
// failure.
//
// Not thread-safe: callers must serialize read/seek/close on one instance.
class SegmentedRangeStream {
public:
    static constexpr int kDefaultRetryLimit = 5;

    SegmentedRangeStream(std::shared_ptr<RangeFetcher> fetcher, std::string url, uint64_t length,
                         uint64_t segmentSize, int retryLimit = kDefaultRetryLimit);
    ~SegmentedRangeStream();

    SegmentedRangeStream(const SegmentedRangeStream&) = delete;
    SegmentedRangeStream& operator=(const SegmentedRangeStream&) = delete;

    uint64_t position() const { return pos; }
    uint64_t length() const { return totalLength; }
    uint64_t segmentSize() const { return segSize; }
    int retryLimit() const { return maxRetries; }
    const std::string& url() const { return resourceUrl; }

    bool canRead() const { return true; }
    bool canSeek() const { return true; }
    bool canWrite() const { return false; }

    // Moves the cursor and returns the new absolute position. Throws
    // InvalidPosition (state untouched) if the result would be negative.
    // Seeking to the current position keeps the open segment.
    uint64_t seek(int64_t offset, SeekOrigin origin);
    void setPosition(uint64_t newPosition);

    // Reads up to count bytes at position(). Returns 0 only at or past the
    // end of the resource. Transient failures are retried at the same offset;
    // throws SegmentFetchExhausted once more than retryLimit attempts failed,
    // and OperationCancelled if token fires. position() is unchanged on throw.
    size_t read(char* buffer, size_t count, const CancellationToken* token = nullptr);

    void close();

    void write(const char* buffer, size_t count);
    void flush();
    void setLength(uint64_t value);

private:
    void releaseSegment();

    std::shared_ptr<RangeFetcher> fetcher;
    std::string resourceUrl;
    uint64_t totalLength;
    uint64_t segSize;
    int maxRetries;

    uint64_t pos = 0;
    std::unique_ptr<ByteSource> activeSegment;
    // Whether activeSegment has produced any bytes since it was opened.
    bool segmentDelivered = false;
};
