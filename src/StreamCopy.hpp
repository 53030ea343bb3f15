#pragma once
#include <cstdint>
#include <functional>
#include <ostream>
#include "SegmentedRangeStream.hpp"

// Drains stream from its current position into out. progress, if set, is
// called after every chunk with position()/length() and once more with 1.0
// at the end. maxBytes caps the copy (0 means until end of stream).
// Returns the number of bytes written.
uint64_t copyStream(SegmentedRangeStream& stream, std::ostream& out, size_t bufferSize,
                    std::function<void(double)> progress = nullptr,
                    const CancellationToken* token = nullptr, uint64_t maxBytes = 0);
