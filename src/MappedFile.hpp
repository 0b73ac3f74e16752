#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only mapping of a whole file. Empty files are not mapped.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    size_t size() const;
    const char* data() const;
    std::string bytes() const;

private:
    std::unique_ptr<boost::interprocess::file_mapping> fileMapping;
    std::unique_ptr<boost::interprocess::mapped_region> region;
    size_t fileSize;
};
