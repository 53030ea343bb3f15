#include "SegmentedRangeStream.hpp"
#include <limits>
#include <stdexcept>
#include <utility>
#include "StreamErrors.hpp"

SegmentedRangeStream::SegmentedRangeStream(std::shared_ptr<RangeFetcher> fetcher, std::string url,
                                           uint64_t length, uint64_t segmentSize, int retryLimit)
    : fetcher(std::move(fetcher)),
      resourceUrl(std::move(url)),
      totalLength(length),
      segSize(segmentSize),
      maxRetries(retryLimit) {
    if (!this->fetcher) {
        throw std::invalid_argument("SegmentedRangeStream requires a range fetcher");
    }
    if (segSize == 0) {
        throw std::invalid_argument("Segment size must be positive");
    }
    if (maxRetries < 0) {
        throw std::invalid_argument("Retry limit must not be negative");
    }
}

SegmentedRangeStream::~SegmentedRangeStream() {
    close();
}

void SegmentedRangeStream::releaseSegment() {
    activeSegment.reset();
    segmentDelivered = false;
}

void SegmentedRangeStream::close() {
    releaseSegment();
}

uint64_t SegmentedRangeStream::seek(int64_t offset, SeekOrigin origin) {
    uint64_t base = 0;
    switch (origin) {
        case SeekOrigin::Begin:
            base = 0;
            break;
        case SeekOrigin::Current:
            base = pos;
            break;
        case SeekOrigin::End:
            base = totalLength;
            break;
        default:
            throw std::invalid_argument("Unknown seek origin");
    }

    uint64_t target;
    if (offset < 0) {
        // Negate in unsigned arithmetic so INT64_MIN is handled.
        uint64_t back = uint64_t(0) - static_cast<uint64_t>(offset);
        if (back > base) {
            throw InvalidPosition("An attempt was made to move the position before the beginning of the stream");
        }
        target = base - back;
    } else {
        uint64_t forward = static_cast<uint64_t>(offset);
        if (forward > std::numeric_limits<uint64_t>::max() - base) {
            throw InvalidPosition("Seek offset overflows the position range");
        }
        target = base + forward;
    }

    setPosition(target);
    return pos;
}

void SegmentedRangeStream::setPosition(uint64_t newPosition) {
    if (newPosition == pos) {
        return;
    }
    releaseSegment();
    pos = newPosition;
}

size_t SegmentedRangeStream::read(char* buffer, size_t count, const CancellationToken* token) {
    if (pos >= totalLength || count == 0) {
        return 0;
    }

    int failures = 0;
    std::string lastCause;

    while (true) {
        try {
            throwIfCancelled(token);

            if (!activeSegment) {
                uint64_t end = pos + (segSize - 1);
                if (end < pos) {
                    end = std::numeric_limits<uint64_t>::max();
                }
                activeSegment = fetcher->open(resourceUrl, pos, end, token);
                segmentDelivered = false;
                if (!activeSegment) {
                    throw TransientFetchError("Range fetcher returned no source");
                }
            }

            throwIfCancelled(token);
            size_t bytesRead = activeSegment->read(buffer, count);
            if (bytesRead > 0) {
                // Advance in place; the open segment continues from here.
                pos += bytesRead;
                segmentDelivered = true;
                return bytesRead;
            }

            // A segment that ran dry after delivering data is an ordinary
            // segment boundary. One that never delivered is a no-progress cycle
            // and is charged to the retry budget.
            bool boundary = segmentDelivered;
            releaseSegment();
            if (boundary) {
                continue;
            }
            lastCause = "segment at offset " + std::to_string(pos) + " returned no data";
        } catch (const TransientFetchError& e) {
            releaseSegment();
            lastCause = e.what();
        } catch (...) {
            releaseSegment();
            throw;
        }

        if (++failures > maxRetries) {
            throw SegmentFetchExhausted("Failed to read " + resourceUrl + " at offset " + std::to_string(pos) +
                                            " after " + std::to_string(failures) + " attempts: " + lastCause,
                                        failures);
        }
    }
}

void SegmentedRangeStream::write(const char*, size_t) {
    throw NotSupported("SegmentedRangeStream is read-only");
}

void SegmentedRangeStream::flush() {
    throw NotSupported("SegmentedRangeStream is read-only");
}

void SegmentedRangeStream::setLength(uint64_t) {
    throw NotSupported("SegmentedRangeStream has a fixed length");
}
