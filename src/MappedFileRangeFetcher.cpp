#include "MappedFileRangeFetcher.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <utility>
#include <boost/interprocess/exceptions.hpp>
#include <trantor/utils/Logger.h>
#include "StreamErrors.hpp"

MappedByteSource::MappedByteSource(std::shared_ptr<MappedFile> file, size_t begin, size_t count)
    : file(std::move(file)), cursor(begin), limit(begin + count) {}

size_t MappedByteSource::read(char* buffer, size_t count) {
    size_t n = std::min(count, limit - cursor);
    if (n > 0) {
        std::memcpy(buffer, file->data() + cursor, n);
        cursor += n;
    }
    return n;
}

std::string MappedFileRangeFetcher::pathFromUrl(const std::string& url) {
    static const std::string scheme = "file://";
    if (url.compare(0, scheme.size(), scheme) == 0) {
        return url.substr(scheme.size());
    }
    return url;
}

void MappedFileRangeFetcher::setAllowedPaths(const std::vector<std::string>& paths) {
    std::unique_lock lock(mutex);
    allowedPaths.clear();
    for (const auto& path : paths) {
        try {
            allowedPaths.push_back(std::filesystem::canonical(path).string());
        } catch (const std::filesystem::filesystem_error& e) {
            LOG_WARN << "Ignoring allowed path " << path << ": " << e.what();
        }
    }
}

bool MappedFileRangeFetcher::isPathAllowed(const std::string& path) const {
    std::string canonical;
    try {
        canonical = std::filesystem::canonical(path).string();
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
    std::shared_lock lock(mutex);
    return isPathAllowedLocked(canonical);
}

bool MappedFileRangeFetcher::isPathAllowedLocked(const std::string& canonical) const {
    if (allowedPaths.empty()) {
        return true;
    }
    for (const auto& allowed : allowedPaths) {
        if (canonical == allowed || canonical.compare(0, allowed.length() + 1, allowed + "/") == 0) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<MappedFile> MappedFileRangeFetcher::acquire(const std::string& url) {
    std::string path = pathFromUrl(url);
    std::string canonical;
    try {
        canonical = std::filesystem::canonical(path).string();
    } catch (const std::filesystem::filesystem_error& e) {
        throw FetchError("Cannot resolve " + path + ": " + e.what());
    }

    {
        std::shared_lock lock(mutex);
        if (!isPathAllowedLocked(canonical)) {
            throw FetchError("Access denied: " + canonical + " is not in the allowed list");
        }
        auto it = pathMap.find(canonical);
        if (it != pathMap.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex);
    auto it = pathMap.find(canonical);
    if (it != pathMap.end()) {
        return it->second;
    }
    std::shared_ptr<MappedFile> file;
    try {
        file = std::make_shared<MappedFile>(canonical);
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw TransientFetchError("Failed to map " + canonical + ": " + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw TransientFetchError("Failed to map " + canonical + ": " + e.what());
    }
    LOG_DEBUG << "Mapped " << canonical << " (" << file->size() << " bytes)";
    pathMap[canonical] = file;
    return file;
}

std::unique_ptr<ByteSource> MappedFileRangeFetcher::open(const std::string& url, uint64_t start, uint64_t end,
                                                         const CancellationToken* token) {
    throwIfCancelled(token);
    if (end < start) {
        throw std::invalid_argument("Range end precedes start");
    }
    auto file = acquire(url);
    uint64_t size = file->size();
    if (start >= size) {
        return std::make_unique<MappedByteSource>(file, 0, 0);
    }
    uint64_t last = std::min<uint64_t>(end, size - 1);
    return std::make_unique<MappedByteSource>(file, static_cast<size_t>(start),
                                              static_cast<size_t>(last - start + 1));
}

uint64_t MappedFileRangeFetcher::fileSize(const std::string& url) {
    return acquire(url)->size();
}

void MappedFileRangeFetcher::clear() {
    std::unique_lock lock(mutex);
    pathMap.clear();
}

size_t MappedFileRangeFetcher::cachedCount() const {
    std::shared_lock lock(mutex);
    return pathMap.size();
}
