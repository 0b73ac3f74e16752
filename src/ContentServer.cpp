#include "ContentServer.hpp"
#include "MappedFile.hpp"
#include "ServiceError.hpp"
#include <trantor/utils/Logger.h>
#include <boost/interprocess/exceptions.hpp>
#include <memory>

ContentServer::ContentServer(const ViewerConfig& config) : config_(config) {}

std::string ContentServer::contentTypeFor(const std::filesystem::path& path) {
    if (lowerExtension(path) == ".json") {
        return "application/json";
    }
    return "text/plain";
}

void ContentServer::checkRegularFile(const std::filesystem::path& path) const {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        LOG_WARN << "File not found: " << path.string();
        throw ServiceError(ErrorKind::NotFound, "File not found: " + path.filename().string());
    }
    if (status.type() == std::filesystem::file_type::none) {
        LOG_ERROR << "Error accessing file " << path.string() << ": " << ec.message();
        throw ServiceError(ErrorKind::Internal, ec.message());
    }
    if (std::filesystem::is_directory(status)) {
        LOG_WARN << "Cannot display directory content: " << path.string();
        throw ServiceError(ErrorKind::BadRequest, "Cannot display directory content");
    }
}

std::string ContentServer::readBytes(const std::filesystem::path& path) const {
    try {
        MappedFile file(path.string());
        return file.bytes();
    } catch (const boost::interprocess::interprocess_exception& e) {
        LOG_ERROR << "Error reading file " << path.string() << ": " << e.what();
        throw ServiceError(ErrorKind::Internal, e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR << "Error reading file " << path.string() << ": " << e.what();
        throw ServiceError(ErrorKind::Internal, e.what());
    }
}

FileContent ContentServer::readContent(const std::filesystem::path& resolvedPath) const {
    checkRegularFile(resolvedPath);
    if (!config_.isAllowedExtension(resolvedPath)) {
        std::string ext = lowerExtension(resolvedPath);
        LOG_WARN << "Unsupported file type: " << ext;
        throw ServiceError(ErrorKind::BadRequest, "Unsupported file type: " + ext);
    }
    FileContent content;
    content.bytes = readBytes(resolvedPath);
    content.contentType = contentTypeFor(resolvedPath);
    LOG_DEBUG << "Sending file content, size: " << content.bytes.size() << " bytes";
    return content;
}

Json::Value ContentServer::readJson(const std::filesystem::path& resolvedPath) const {
    checkRegularFile(resolvedPath);
    std::string ext = lowerExtension(resolvedPath);
    if (ext != ".json") {
        LOG_WARN << "File is not JSON: " << resolvedPath.string() << " (ext: " << ext << ")";
        throw ServiceError(ErrorKind::BadRequest, "File is not JSON");
    }
    std::string bytes = readBytes(resolvedPath);

    Json::CharReaderBuilder builder;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    builder["allowTrailingCommas"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value document;
    std::string errs;
    if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), &document, &errs)) {
        LOG_WARN << "Error parsing JSON " << resolvedPath.string() << ": " << errs;
        throw ServiceError(ErrorKind::BadRequest, "Invalid JSON: " + errs);
    }
    return document;
}
