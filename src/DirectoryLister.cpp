#include "DirectoryLister.hpp"
#include "PathResolver.hpp"
#include "ServiceError.hpp"
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <utility>

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time) {
    // file_time_type has no portable epoch in C++17; shift it across via both clocks' now().
    auto shifted = time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now();
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(shifted);
}

bool entryOrder(const FileEntry& a, const FileEntry& b) {
    if (a.isDirectory != b.isDirectory) {
        return a.isDirectory;
    }
    return a.name < b.name;
}

DirectoryLister::DirectoryLister(const ViewerConfig& config) : config_(config) {}

bool DirectoryLister::isExcludedDirectory(const std::filesystem::path& path) const {
    std::filesystem::path scope = path;
    if (!config_.rootDirectory.empty()) {
        auto relative = path.lexically_relative(config_.rootDirectory);
        if (!relative.empty()) {
            scope = relative;
        }
    }
    for (const auto& part : scope) {
        if (config_.excludedDirectories.count(part.string()) > 0) {
            return true;
        }
    }
    return false;
}

bool DirectoryLister::isInsideRoot(const std::filesystem::path& path) const {
    std::error_code ec;
    auto canonicalPath = std::filesystem::canonical(path, ec);
    if (ec) {
        LOG_WARN << "Cannot canonicalize " << path.string() << ": " << ec.message();
        return false;
    }
    if (!isWithinRoot(canonicalPath, config_.rootDirectory)) {
        LOG_DEBUG << "Skipping entry outside root: " << path.string() << " -> " << canonicalPath.string();
        return false;
    }
    return true;
}

bool DirectoryLister::hasRelevantFiles(const std::filesystem::path& directory) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        LOG_WARN << "Cannot scan " << directory.string() << ": " << ec.message();
        return false;
    }
    for (const auto& entry : it) {
        std::error_code entryEc;
        if (entry.is_directory(entryEc) || entryEc) {
            continue;
        }
        if (config_.isAllowedExtension(entry.path()) && isInsideRoot(entry.path())) {
            return true;
        }
    }
    return false;
}

std::vector<FileEntry> DirectoryLister::list(const std::filesystem::path& directory) const {
    std::error_code ec;
    auto status = std::filesystem::status(directory, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        throw ServiceError(ErrorKind::NotFound, "Directory not found: " + directory.string());
    }
    if (status.type() == std::filesystem::file_type::none) {
        throw ServiceError(ErrorKind::Internal, ec.message());
    }
    if (!std::filesystem::is_directory(status)) {
        throw ServiceError(ErrorKind::BadRequest, "Not a directory: " + directory.string());
    }

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        LOG_ERROR << "Error reading directory " << directory.string() << ": " << ec.message();
        throw ServiceError(ErrorKind::Internal, ec.message());
    }

    std::vector<FileEntry> entries;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (config_.ignoreHidden && !name.empty() && name.front() == '.') {
            continue;
        }

        std::error_code entryEc;
        bool isDir = entry.is_directory(entryEc);
        if (entryEc) {
            LOG_WARN << "Error getting file info for " << entry.path().string() << ": " << entryEc.message();
            continue;
        }
        if (entry.is_symlink(entryEc) && !isInsideRoot(entry.path())) {
            continue;
        }
        if (isDir) {
            if (isExcludedDirectory(entry.path())) {
                continue;
            }
            if (!hasRelevantFiles(entry.path())) {
                LOG_DEBUG << "Skipping directory without relevant files: " << entry.path().string();
                continue;
            }
        } else if (!config_.isAllowedExtension(entry.path())) {
            continue;
        }

        FileEntry fileEntry;
        fileEntry.name = name;
        fileEntry.relativePath = entry.path().lexically_relative(directory).string();
        fileEntry.isDirectory = isDir;
        if (!isDir) {
            auto size = entry.file_size(entryEc);
            if (entryEc) {
                LOG_WARN << "Error getting size of " << entry.path().string() << ": " << entryEc.message();
                continue;
            }
            fileEntry.sizeBytes = static_cast<int64_t>(size);
        }
        auto modified = entry.last_write_time(entryEc);
        if (entryEc) {
            LOG_WARN << "Error getting modification time of " << entry.path().string() << ": " << entryEc.message();
            continue;
        }
        fileEntry.modifiedAt = toSystemTime(modified);

        LOG_DEBUG << "Adding to list: " << fileEntry.relativePath << " (isDir: " << isDir << ")";
        entries.push_back(std::move(fileEntry));
    }

    std::stable_sort(entries.begin(), entries.end(), entryOrder);
    LOG_INFO << "Found " << entries.size() << " items in directory " << directory.string();
    return entries;
}
