#include <drogon/drogon.h>
#include <json/json.h>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include "CorsAdvice.hpp"
#include "ViewerConfig.hpp"
#include "ViewerController.hpp"

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

void sendError(const ViewerController& controller, const ServiceError& error, const Callback& callback) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(controller.createError(error));
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(error.httpStatus()));
    callback(resp);
}

// Runs `handler`, turning a thrown failure into an error response.
void respond(const ViewerController& controller, const Callback& callback,
             const std::function<drogon::HttpResponsePtr()>& handler) {
    try {
        callback(handler());
    } catch (const ServiceError& e) {
        sendError(controller, e, callback);
    } catch (const std::exception& e) {
        LOG_ERROR << "Unexpected error: " << e.what();
        sendError(controller, ServiceError(ErrorKind::Internal, e.what()), callback);
    }
}

void handleListFiles(const ViewerController& controller, const drogon::HttpRequestPtr& req, Callback&& callback) {
    respond(controller, callback, [&]() {
        Json::Value files = controller.listFiles(req->getParameter("dir"));
        return drogon::HttpResponse::newHttpJsonResponse(files);
    });
}

void handleContent(const ViewerController& controller, const drogon::HttpRequestPtr& req, Callback&& callback) {
    static const std::string prefix = "/api/content/";
    respond(controller, callback, [&]() {
        std::string fileName = req->path().substr(prefix.size());
        FileContent content = controller.getContent(fileName, req->getParameter("dir"));
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setContentTypeString(content.contentType);
        resp->setBody(std::move(content.bytes));
        return resp;
    });
}

void handleQuery(const ViewerController& controller, const drogon::HttpRequestPtr& req, Callback&& callback) {
    respond(controller, callback, [&]() {
        Json::Value result = controller.queryJson(req->getParameter("file"), req->getParameter("path"),
                                                  req->getParameter("dir"));
        return drogon::HttpResponse::newHttpJsonResponse(result);
    });
}

trantor::Logger::LogLevel parseLogLevel(const std::string& level) {
    if (level == "trace") return trantor::Logger::kTrace;
    if (level == "debug") return trantor::Logger::kDebug;
    if (level == "warn") return trantor::Logger::kWarn;
    if (level == "error") return trantor::Logger::kError;
    return trantor::Logger::kInfo;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    ViewerConfig config;
    try {
        config = loadViewerConfig(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }
    trantor::Logger::setLogLevel(parseLogLevel(config.logLevel));

    // Config is fixed from here on; handlers only read it through the controller.
    const ViewerConfig& settings = config;
    ViewerController controller(settings);

    if (settings.hasListeners) {
        app().loadConfigFile(configPath);
    } else {
        app().addListener("0.0.0.0", static_cast<uint16_t>(settings.port));
        app().setThreadNum(settings.threads);
    }

    app().registerHandler("/api/files",
        [&controller](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleListFiles(controller, req, std::move(callback));
        },
        {Get});

    // File names may span several path segments.
    app().registerHandlerViaRegex("/api/content/.+",
        [&controller](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleContent(controller, req, std::move(callback));
        },
        {Get});

    app().registerHandlerViaRegex("/api/query/?",
        [&controller](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleQuery(controller, req, std::move(callback));
        },
        {Get});

    std::error_code ec;
    auto staticDir = std::filesystem::absolute(settings.staticDirectory, ec);
    if (!ec && std::filesystem::is_directory(staticDir, ec)) {
        app().setDocumentRoot(staticDir.string());
        LOG_INFO << "Serving static files from directory: " << staticDir.string();
    } else {
        LOG_WARN << "Static files directory not found: " << settings.staticDirectory.string();
    }

    // CORS support; a non-null response here short-circuits routing.
    app().registerSyncAdvice(preflightResponse);

    app().registerPostHandlingAdvice([](const HttpRequestPtr& req, const HttpResponsePtr& resp) {
        addCorsHeaders(resp);
        auto elapsed = trantor::Date::now().microSecondsSinceEpoch() - req->creationDate().microSecondsSinceEpoch();
        LOG_INFO << req->methodString() << " " << req->path() << " " << static_cast<int>(resp->statusCode()) << " "
                 << elapsed << "us";
    });

    LOG_INFO << "Root directory: " << settings.rootDirectory.string();
    LOG_INFO << "Starting server in " << settings.modeName() << " mode";
    if (!settings.hasListeners) {
        LOG_INFO << "Server running on http://localhost:" << settings.port;
    }
    app().run();

    return 0;
}
