#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "ViewerConfig.hpp"

// Filesystem capabilities used by resolution. Tests substitute in-memory versions.
struct FileSystemAccess {
    std::function<bool(const std::filesystem::path&)> isRegularFile;
    // Names of the immediate subdirectories of a directory, in any order.
    std::function<std::vector<std::string>(const std::filesystem::path&)> listSubdirectories;
    // Symlink-resolved absolute form of an existing path; throws on failure.
    std::function<std::filesystem::path(const std::filesystem::path&)> canonical;

    static FileSystemAccess local();
};

// Locations tried in priority order for one request.
using CandidateList = std::vector<std::filesystem::path>;

// Joins `relative` under `root` unless it is already absolute.
std::filesystem::path joinUnderRoot(const std::filesystem::path& root, const std::string& relative);

CandidateList buildCandidates(const std::filesystem::path& root, const std::string& requestedName,
                              const std::string& directoryHint, const FileSystemAccess& access);

// First candidate that is an existing regular file.
std::optional<std::filesystem::path> selectCandidate(const CandidateList& candidates,
                                                     const std::function<bool(const std::filesystem::path&)>& isRegularFile);

// True when `canonicalPath` equals `canonicalRoot` or lies beneath it.
bool isWithinRoot(const std::filesystem::path& canonicalPath, const std::filesystem::path& canonicalRoot);

class PathResolver {
public:
    explicit PathResolver(const ViewerConfig& config);
    PathResolver(const ViewerConfig& config, FileSystemAccess access);

    // Resolves a requested file name to the first existing candidate inside the
    // root. Throws ServiceError: NotFound when no candidate exists, BadRequest
    // when every existing candidate escapes the root.
    std::filesystem::path resolve(const std::string& requestedName, const std::string& directoryHint) const;

    // Resolves the `dir` parameter of a listing request to an existing directory.
    std::filesystem::path resolveDirectory(const std::string& dir) const;

    const std::filesystem::path& root() const { return config_.rootDirectory; }

private:
    bool isContained(const std::filesystem::path& path) const;

    const ViewerConfig& config_;
    FileSystemAccess access_;
};
