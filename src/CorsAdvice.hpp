#pragma once
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

// Answers a CORS preflight. Returns nullptr for anything but OPTIONS so routing continues.
drogon::HttpResponsePtr preflightResponse(const drogon::HttpRequestPtr& req);

void addCorsHeaders(const drogon::HttpResponsePtr& resp);
