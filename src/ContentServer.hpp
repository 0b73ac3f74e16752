#pragma once
#include <json/json.h>
#include <filesystem>
#include <string>
#include "ViewerConfig.hpp"

struct FileContent {
    std::string bytes;
    std::string contentType;
};

class ContentServer {
public:
    explicit ContentServer(const ViewerConfig& config);

    // Raw bytes of an allowed file, unmodified.
    FileContent readContent(const std::filesystem::path& resolvedPath) const;

    // Parsed document of a `.json` file, for queries.
    Json::Value readJson(const std::filesystem::path& resolvedPath) const;

    static std::string contentTypeFor(const std::filesystem::path& path);

private:
    void checkRegularFile(const std::filesystem::path& path) const;
    std::string readBytes(const std::filesystem::path& path) const;

    const ViewerConfig& config_;
};
