#include "MappedFile.hpp"
#include <filesystem>

// boost refuses to map an empty file, so zero-length files get no region.
MappedFile::MappedFile(const std::string& path)
    : filePath(path),
      fileMapping(path.c_str(), boost::interprocess::read_only),
      region(),
      fileSize(std::filesystem::file_size(path)) {
    if (fileSize > 0) {
        boost::interprocess::mapped_region mapped(fileMapping, boost::interprocess::read_only);
        region.swap(mapped);
        fileSize = region.get_size();
    }
}

size_t MappedFile::size() const {
    return fileSize;
}

const char* MappedFile::data() const {
    return static_cast<const char*>(region.get_address());
}
