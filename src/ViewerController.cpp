#include "ViewerController.hpp"
#include <trantor/utils/Logger.h>
#include <utility>

ViewerController::ViewerController(const ViewerConfig& config)
    : ViewerController(config, FileSystemAccess::local()) {}

ViewerController::ViewerController(const ViewerConfig& config, FileSystemAccess access)
    : config_(config),
      resolver_(config, std::move(access)),
      lister_(config),
      content_(config) {}

Json::Value ViewerController::createError(const ServiceError& error) const {
    Json::Value response;
    response["error"]["code"] = error.code();
    response["error"]["message"] = error.what();
    return response;
}

Json::Value ViewerController::listFiles(const std::string& dir) const {
    LOG_INFO << "Listing files in directory: " << (dir.empty() ? "." : dir);
    auto directory = resolver_.resolveDirectory(dir);
    Json::Value result(Json::arrayValue);
    for (const auto& entry : lister_.list(directory)) {
        result.append(entry.toJson());
    }
    return result;
}

FileContent ViewerController::getContent(const std::string& fileName, const std::string& dir) const {
    LOG_INFO << "Getting content for file: " << fileName << " in directory: " << dir;
    if (fileName.empty()) {
        throw ServiceError(ErrorKind::BadRequest, "Missing file name");
    }
    auto path = resolver_.resolve(fileName, dir);
    return content_.readContent(path);
}

Json::Value ViewerController::queryJson(const std::string& file, const std::string& path, const std::string& dir) const {
    LOG_INFO << "Querying JSON file: " << file << " with path: " << path << " in directory: " << dir;
    if (file.empty() || path.empty()) {
        throw ServiceError(ErrorKind::BadRequest, "Missing file or path parameter");
    }
    auto resolved = resolver_.resolve(file, dir);
    Json::Value document = content_.readJson(resolved);
    return evaluator_.evaluate(document, path);
}
