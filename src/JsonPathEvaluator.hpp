#pragma once
#include <json/json.h>
#include <cstddef>
#include <string>
#include <vector>

// The six JSON kinds; jsoncpp's int/uint/real all fold into Number.
enum class JsonKind {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

JsonKind kindOf(const Json::Value& value);
const char* kindName(JsonKind kind);

// One dot-separated piece of a query path: `key`, `key[index]` or `[index]`,
// optionally followed by text after the closing bracket.
struct PathSegment {
    std::string key;
    bool hasIndex = false;
    std::string indexText;
    size_t index = 0;
    bool indexOverflow = false;
    std::string rest;
};

// Splits on '.' keeping empty pieces, so "" yields one empty segment.
std::vector<std::string> splitPath(const std::string& path);

// Scans `key` up to the first well-formed `[digits]` group, then the index,
// then the remainder. Without such a group the whole text is a plain key.
PathSegment parseSegment(const std::string& text);

class JsonPathEvaluator {
public:
    // Narrows `document` along `path`. Missing object keys yield null, and key
    // lookups on that null stay null; type and range violations throw
    // ServiceError(BadRequest).
    Json::Value evaluate(const Json::Value& document, const std::string& path) const;

private:
    Json::Value lookupKey(const Json::Value& current, const std::string& key) const;
    Json::Value indexArray(const Json::Value& current, const PathSegment& segment) const;
};
