#include "PathResolver.hpp"
#include "ServiceError.hpp"
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <sstream>
#include <utility>

FileSystemAccess FileSystemAccess::local() {
    FileSystemAccess access;
    access.isRegularFile = [](const std::filesystem::path& path) {
        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        return !ec && std::filesystem::exists(status) && !std::filesystem::is_directory(status);
    };
    access.listSubdirectories = [](const std::filesystem::path& dir) {
        std::vector<std::string> names;
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            LOG_WARN << "Cannot enumerate " << dir.string() << ": " << ec.message();
            return names;
        }
        for (const auto& entry : it) {
            std::error_code entryEc;
            if (entry.is_directory(entryEc) && !entryEc) {
                names.push_back(entry.path().filename().string());
            }
        }
        return names;
    };
    access.canonical = [](const std::filesystem::path& path) {
        return std::filesystem::canonical(path);
    };
    return access;
}

std::filesystem::path joinUnderRoot(const std::filesystem::path& root, const std::string& relative) {
    std::filesystem::path rel(relative);
    if (rel.is_absolute()) {
        return rel.lexically_normal();
    }
    return (root / rel).lexically_normal();
}

CandidateList buildCandidates(const std::filesystem::path& root, const std::string& requestedName,
                              const std::string& directoryHint, const FileSystemAccess& access) {
    CandidateList candidates;
    if (!directoryHint.empty()) {
        candidates.push_back(joinUnderRoot(joinUnderRoot(root, directoryHint), requestedName));
    }
    candidates.push_back(joinUnderRoot(root, requestedName));

    bool multiSegment = requestedName.find('/') != std::string::npos;
    if (!multiSegment) {
        // One level down, for clients that send a bare file name without its directory.
        std::vector<std::string> subdirs = access.listSubdirectories(root);
        std::sort(subdirs.begin(), subdirs.end());
        for (const auto& dir : subdirs) {
            candidates.push_back(joinUnderRoot(root / dir, requestedName));
        }
    } else {
        candidates.push_back(joinUnderRoot(root, requestedName));
    }
    return candidates;
}

std::optional<std::filesystem::path> selectCandidate(const CandidateList& candidates,
                                                     const std::function<bool(const std::filesystem::path&)>& isRegularFile) {
    for (const auto& candidate : candidates) {
        if (isRegularFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool isWithinRoot(const std::filesystem::path& canonicalPath, const std::filesystem::path& canonicalRoot) {
    std::string path = canonicalPath.generic_string();
    std::string root = canonicalRoot.generic_string();
    if (path == root) {
        return true;
    }
    std::string prefix = (!root.empty() && root.back() == '/') ? root : root + "/";
    return path.compare(0, prefix.size(), prefix) == 0;
}

namespace {

std::string describe(const CandidateList& candidates) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (i > 0) {
            out << " ";
        }
        out << candidates[i].string();
    }
    out << "]";
    return out.str();
}

} // namespace

PathResolver::PathResolver(const ViewerConfig& config)
    : PathResolver(config, FileSystemAccess::local()) {}

PathResolver::PathResolver(const ViewerConfig& config, FileSystemAccess access)
    : config_(config), access_(std::move(access)) {}

bool PathResolver::isContained(const std::filesystem::path& path) const {
    std::filesystem::path canonicalPath;
    try {
        canonicalPath = access_.canonical(path);
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR << "Cannot canonicalize " << path.string() << ": " << e.what();
        throw ServiceError(ErrorKind::Internal, e.what());
    }
    if (!isWithinRoot(canonicalPath, config_.rootDirectory)) {
        LOG_WARN << "Security error: " << canonicalPath.string() << " is outside " << config_.rootDirectory.string();
        return false;
    }
    return true;
}

std::filesystem::path PathResolver::resolve(const std::string& requestedName, const std::string& directoryHint) const {
    CandidateList candidates = buildCandidates(config_.rootDirectory, requestedName, directoryHint, access_);
    // Files that exist but leave the root are skipped so a later in-root candidate can still match.
    bool escaped = false;
    auto selected = selectCandidate(candidates, [&](const std::filesystem::path& candidate) {
        if (!access_.isRegularFile(candidate)) {
            return false;
        }
        if (isContained(candidate)) {
            return true;
        }
        escaped = true;
        return false;
    });
    if (!selected) {
        if (escaped) {
            throw ServiceError(ErrorKind::BadRequest, "Invalid file path");
        }
        LOG_WARN << "Could not resolve file: " << requestedName << ", attempted paths: " << describe(candidates);
        throw ServiceError(ErrorKind::NotFound, "File not found: " + requestedName);
    }
    LOG_DEBUG << "Resolved " << requestedName << " to " << selected->string();
    return *selected;
}

std::filesystem::path PathResolver::resolveDirectory(const std::string& dir) const {
    std::filesystem::path target = (dir.empty() || dir == ".") ? config_.rootDirectory
                                                               : joinUnderRoot(config_.rootDirectory, dir);
    std::error_code ec;
    auto status = std::filesystem::status(target, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        LOG_WARN << "Directory not found: " << target.string();
        throw ServiceError(ErrorKind::NotFound, "Directory not found: " + dir);
    }
    if (status.type() == std::filesystem::file_type::none) {
        LOG_ERROR << "Error accessing directory " << target.string() << ": " << ec.message();
        throw ServiceError(ErrorKind::Internal, ec.message());
    }

    std::filesystem::path canonicalPath;
    try {
        canonicalPath = access_.canonical(target);
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR << "Cannot canonicalize " << target.string() << ": " << e.what();
        throw ServiceError(ErrorKind::Internal, e.what());
    }
    if (!isWithinRoot(canonicalPath, config_.rootDirectory)) {
        LOG_WARN << "Security error: " << canonicalPath.string() << " is outside " << config_.rootDirectory.string();
        throw ServiceError(ErrorKind::BadRequest, "Invalid directory path");
    }
    if (!std::filesystem::is_directory(status)) {
        LOG_WARN << "Not a directory: " << target.string();
        throw ServiceError(ErrorKind::BadRequest, "Not a directory: " + dir);
    }
    return canonicalPath;
}
