#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "FileEntry.hpp"
#include "ViewerConfig.hpp"

class DirectoryLister {
public:
    explicit DirectoryLister(const ViewerConfig& config);

    // Immediate children of `directory` worth showing in the viewer: directories
    // first, then files, each group in case-sensitive name order.
    // Throws ServiceError: NotFound, BadRequest (not a directory) or Internal.
    std::vector<FileEntry> list(const std::filesystem::path& directory) const;

    // True when any component of `path` below the root names an excluded directory.
    bool isExcludedDirectory(const std::filesystem::path& path) const;

    // False for entries whose symlink-resolved location is outside the root.
    bool isInsideRoot(const std::filesystem::path& path) const;

    // Shallow check: does `directory` directly contain a file with an allowed extension?
    bool hasRelevantFiles(const std::filesystem::path& directory) const;

private:
    const ViewerConfig& config_;
};

// Directories before files, then by name.
bool entryOrder(const FileEntry& a, const FileEntry& b);

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time);
