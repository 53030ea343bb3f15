#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "MappedFile.hpp"
#include "RangeFetcher.hpp"

// Serves byte ranges of local files through shared read-only mappings.
// Accepts plain paths and file:// URLs.
class MappedFileRangeFetcher : public RangeFetcher {
public:
    std::unique_ptr<ByteSource> open(const std::string& url, uint64_t start, uint64_t end,
                                     const CancellationToken* token) override;

    uint64_t fileSize(const std::string& url);

    void setAllowedPaths(const std::vector<std::string>& paths);
    bool isPathAllowed(const std::string& path) const;

    // Drops cached mappings. Sources already handed out keep theirs alive.
    void clear();
    size_t cachedCount() const;

    static std::string pathFromUrl(const std::string& url);

private:
    std::shared_ptr<MappedFile> acquire(const std::string& url);
    bool isPathAllowedLocked(const std::string& canonical) const;

    std::unordered_map<std::string, std::shared_ptr<MappedFile>> pathMap;
    std::vector<std::string> allowedPaths;
    mutable std::shared_mutex mutex;
};

// Window [begin, begin + count) of a mapped file.
class MappedByteSource : public ByteSource {
public:
    MappedByteSource(std::shared_ptr<MappedFile> file, size_t begin, size_t count);

    size_t read(char* buffer, size_t count) override;

private:
    std::shared_ptr<MappedFile> file;
    size_t cursor;
    size_t limit;
};
