#pragma once
#include <json/json.h>
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>

struct ViewerConfig {
    std::set<std::string> allowedExtensions{".md", ".json"};
    std::set<std::string> excludedDirectories{"node_modules", "build", "dist"};
    bool ignoreHidden = true;
    bool readOnly = true;
    std::filesystem::path rootDirectory;
    std::filesystem::path staticDirectory = "./frontend/build";
    int port = 8080;
    size_t threads = 0;
    std::string logLevel = "info";
    // True when the config file carries its own drogon "listeners" section.
    bool hasListeners = false;

    bool isAllowedExtension(const std::filesystem::path& path) const;
    std::string modeName() const { return readOnly ? "read-only" : "read-write"; }
};

// Lower-cased extension including the dot, or an empty string.
std::string lowerExtension(const std::filesystem::path& path);

// Applies the "viewer" section of a parsed config document on top of `config`.
// Throws std::runtime_error for values of the wrong type.
void applyViewerSection(const Json::Value& document, ViewerConfig& config);

// Loads config from `file`. A missing file yields defaults rooted at the working
// directory; a malformed file or a missing root directory throws std::runtime_error.
ViewerConfig loadViewerConfig(const std::string& file);
