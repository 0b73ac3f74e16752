#pragma once
#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <string>

// One immediate child of a listed directory. `relativePath` is relative to that directory.
struct FileEntry {
    std::string name;
    std::string relativePath;
    bool isDirectory = false;
    int64_t sizeBytes = 0;
    std::chrono::system_clock::time_point modifiedAt;

    Json::Value toJson() const;
};

// RFC 3339 UTC timestamp with second precision, e.g. 2024-01-31T12:00:00Z.
std::string formatTimestamp(std::chrono::system_clock::time_point time);
