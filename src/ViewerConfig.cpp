#include "ViewerConfig.hpp"
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

std::set<std::string> readStringSet(const Json::Value& value, const std::string& key) {
    if (!value.isArray()) {
        throw std::runtime_error("viewer." + key + " must be an array of strings");
    }
    std::set<std::string> result;
    for (const auto& item : value) {
        if (!item.isString()) {
            throw std::runtime_error("viewer." + key + " must be an array of strings");
        }
        result.insert(item.asString());
    }
    return result;
}

std::string normalizeExtension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

std::filesystem::path canonicalRoot(const std::filesystem::path& root) {
    std::filesystem::path absolute = root.empty() ? std::filesystem::current_path()
                                                  : std::filesystem::absolute(root);
    std::error_code ec;
    if (!std::filesystem::is_directory(absolute, ec)) {
        throw std::runtime_error("Root directory does not exist: " + absolute.string());
    }
    return std::filesystem::canonical(absolute);
}

} // namespace

bool ViewerConfig::isAllowedExtension(const std::filesystem::path& path) const {
    return allowedExtensions.count(lowerExtension(path)) > 0;
}

std::string lowerExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

void applyViewerSection(const Json::Value& document, ViewerConfig& config) {
    config.hasListeners = document.isMember("listeners");
    if (!document.isMember("viewer")) {
        return;
    }
    const Json::Value& viewer = document["viewer"];
    if (!viewer.isObject()) {
        throw std::runtime_error("viewer section must be an object");
    }
    if (viewer.isMember("root")) {
        config.rootDirectory = viewer["root"].asString();
    }
    if (viewer.isMember("static_dir")) {
        config.staticDirectory = viewer["static_dir"].asString();
    }
    if (viewer.isMember("port")) {
        config.port = viewer["port"].asInt();
        if (config.port < 1 || config.port > 65535) {
            throw std::runtime_error("viewer.port out of range: " + std::to_string(config.port));
        }
    }
    if (viewer.isMember("threads")) {
        config.threads = viewer["threads"].asUInt();
    }
    if (viewer.isMember("read_only")) {
        config.readOnly = viewer["read_only"].asBool();
    }
    if (viewer.isMember("ignore_hidden")) {
        config.ignoreHidden = viewer["ignore_hidden"].asBool();
    }
    if (viewer.isMember("log_level")) {
        config.logLevel = viewer["log_level"].asString();
    }
    if (viewer.isMember("allowed_extensions")) {
        config.allowedExtensions.clear();
        for (const auto& ext : readStringSet(viewer["allowed_extensions"], "allowed_extensions")) {
            config.allowedExtensions.insert(normalizeExtension(ext));
        }
    }
    if (viewer.isMember("excluded_directories")) {
        config.excludedDirectories = readStringSet(viewer["excluded_directories"], "excluded_directories");
    }
}

ViewerConfig loadViewerConfig(const std::string& file) {
    ViewerConfig config;
    std::ifstream configFile(file);
    if (!configFile) {
        LOG_INFO << "No config file at " << file << ", using defaults";
    } else {
        Json::Value document;
        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, configFile, &document, &errs)) {
            throw std::runtime_error("Failed to parse " + file + ": " + errs);
        }
        try {
            applyViewerSection(document, config);
        } catch (const Json::Exception& e) {
            throw std::runtime_error("Invalid value in " + file + ": " + e.what());
        }
        LOG_INFO << "Config file " << file << " parsed successfully";
    }
    config.rootDirectory = canonicalRoot(config.rootDirectory);
    return config;
}
