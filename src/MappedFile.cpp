#include "MappedFile.hpp"
#include <filesystem>

MappedFile::MappedFile(const std::string& path)
    : fileSize(std::filesystem::file_size(path)) {
    // mapped_region rejects zero-length mappings
    if (fileSize > 0) {
        fileMapping = std::make_unique<boost::interprocess::file_mapping>(path.c_str(), boost::interprocess::read_only);
        region = std::make_unique<boost::interprocess::mapped_region>(*fileMapping, boost::interprocess::read_only);
        fileSize = region->get_size();
    }
}

size_t MappedFile::size() const {
    return fileSize;
}

const char* MappedFile::data() const {
    return region ? static_cast<const char*>(region->get_address()) : nullptr;
}

std::string MappedFile::bytes() const {
    if (fileSize == 0) {
        return std::string();
    }
    return std::string(data(), fileSize);
}
