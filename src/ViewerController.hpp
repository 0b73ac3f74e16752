#pragma once
#include <json/json.h>
#include <string>
#include "ContentServer.hpp"
#include "DirectoryLister.hpp"
#include "JsonPathEvaluator.hpp"
#include "PathResolver.hpp"
#include "ServiceError.hpp"
#include "ViewerConfig.hpp"

// The three API operations, independent of the HTTP layer. Failures are thrown
// as ServiceError; successful results are JSON values or raw file content.
class ViewerController {
public:
    explicit ViewerController(const ViewerConfig& config);
    ViewerController(const ViewerConfig& config, FileSystemAccess access);

    Json::Value createError(const ServiceError& error) const;

    // GET /api/files?dir=
    Json::Value listFiles(const std::string& dir) const;

    // GET /api/content/{fileName}?dir=
    FileContent getContent(const std::string& fileName, const std::string& dir) const;

    // GET /api/query/?file=&path=&dir=
    Json::Value queryJson(const std::string& file, const std::string& path, const std::string& dir) const;

    const ViewerConfig& config() const { return config_; }

private:
    const ViewerConfig& config_;
    PathResolver resolver_;
    DirectoryLister lister_;
    ContentServer content_;
    JsonPathEvaluator evaluator_;
};
