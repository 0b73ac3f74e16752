#include "CorsAdvice.hpp"

drogon::HttpResponsePtr preflightResponse(const drogon::HttpRequestPtr& req) {
    if (req->method() != drogon::Options) {
        return nullptr;
    }
    auto resp = drogon::HttpResponse::newHttpResponse();
    addCorsHeaders(resp);
    resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
    return resp;
}

void addCorsHeaders(const drogon::HttpResponsePtr& resp) {
    resp->addHeader("Access-Control-Allow-Origin", "*");
}
