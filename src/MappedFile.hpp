#pragma once
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only memory mapping of a whole file.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    size_t size() const;
    const char* data() const;
    const std::string& path() const { return filePath; }

private:
    std::string filePath;
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t fileSize;
};
