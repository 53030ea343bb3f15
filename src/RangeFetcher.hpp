#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "ByteSource.hpp"
#include "CancellationToken.hpp"

// Opens a byte-range read connection. start and end are inclusive and
// start <= end. The returned source yields bytes beginning at start and may
// end early when the resource is shorter than end.
// Throws TransientFetchError when the connection can't be established,
// FetchError for failures that retrying will not fix.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;
    virtual std::unique_ptr<ByteSource> open(const std::string& url, uint64_t start, uint64_t end,
                                             const CancellationToken* token) = 0;
};
