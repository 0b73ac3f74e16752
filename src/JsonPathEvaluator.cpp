#include "JsonPathEvaluator.hpp"
#include "ServiceError.hpp"
#include <trantor/utils/Logger.h>
#include <limits>

JsonKind kindOf(const Json::Value& value) {
    switch (value.type()) {
    case Json::nullValue:
        return JsonKind::Null;
    case Json::booleanValue:
        return JsonKind::Boolean;
    case Json::intValue:
    case Json::uintValue:
    case Json::realValue:
        return JsonKind::Number;
    case Json::stringValue:
        return JsonKind::String;
    case Json::arrayValue:
        return JsonKind::Array;
    case Json::objectValue:
        return JsonKind::Object;
    }
    return JsonKind::Null;
}

const char* kindName(JsonKind kind) {
    switch (kind) {
    case JsonKind::Null:
        return "null";
    case JsonKind::Boolean:
        return "boolean";
    case JsonKind::Number:
        return "number";
    case JsonKind::String:
        return "string";
    case JsonKind::Array:
        return "array";
    case JsonKind::Object:
        return "object";
    }
    return "unknown";
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

namespace {

enum class ScanState {
    Key,
    Index
};

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

void parseIndex(PathSegment& segment) {
    constexpr size_t maxIndex = std::numeric_limits<size_t>::max();
    size_t value = 0;
    for (char c : segment.indexText) {
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (maxIndex - digit) / 10) {
            segment.indexOverflow = true;
            return;
        }
        value = value * 10 + digit;
    }
    segment.index = value;
}

} // namespace

PathSegment parseSegment(const std::string& text) {
    PathSegment segment;
    ScanState state = ScanState::Key;
    size_t bracketStart = 0;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (state == ScanState::Key) {
            if (c == '[') {
                state = ScanState::Index;
                bracketStart = i;
                segment.indexText.clear();
            } else {
                segment.key.push_back(c);
            }
            ++i;
            continue;
        }
        // ScanState::Index
        if (isDigit(c)) {
            segment.indexText.push_back(c);
            ++i;
        } else if (c == ']' && !segment.indexText.empty()) {
            segment.hasIndex = true;
            segment.rest = text.substr(i + 1);
            parseIndex(segment);
            return segment;
        } else {
            // Not a `[digits]` group: the bracket text belongs to the key and
            // the current character is rescanned in key state.
            segment.key.append(text, bracketStart, i - bracketStart);
            segment.indexText.clear();
            state = ScanState::Key;
        }
    }
    if (state == ScanState::Index) {
        segment.key.append(text, bracketStart, std::string::npos);
        segment.indexText.clear();
    }
    return segment;
}

Json::Value JsonPathEvaluator::evaluate(const Json::Value& document, const std::string& path) const {
    Json::Value result = document;
    for (const auto& part : splitPath(path)) {
        PathSegment segment = parseSegment(part);
        if (!segment.hasIndex) {
            result = lookupKey(result, part);
            continue;
        }
        LOG_DEBUG << "Processing array access: key=" << segment.key << ", index=" << segment.indexText
                  << ", rest=" << segment.rest;
        if (!segment.key.empty()) {
            result = lookupKey(result, segment.key);
        }
        result = indexArray(result, segment);
        if (!segment.rest.empty()) {
            LOG_WARN << "Complex array paths not supported: " << segment.rest;
            throw ServiceError(ErrorKind::BadRequest, "Complex array paths not supported");
        }
    }
    return result;
}

Json::Value JsonPathEvaluator::lookupKey(const Json::Value& current, const std::string& key) const {
    JsonKind kind = kindOf(current);
    switch (kind) {
    case JsonKind::Object:
        LOG_DEBUG << "Accessed property '" << key << "'";
        return current.get(key, Json::Value());
    case JsonKind::Null:
        // A missing key stays null for the rest of a plain key chain.
        return Json::Value();
    case JsonKind::Boolean:
    case JsonKind::Number:
    case JsonKind::String:
    case JsonKind::Array:
        break;
    }
    LOG_WARN << "Cannot access property '" << key << "' - not an object, type is " << kindName(kind);
    throw ServiceError(ErrorKind::BadRequest, "Cannot access property '" + key + "' - not an object");
}

Json::Value JsonPathEvaluator::indexArray(const Json::Value& current, const PathSegment& segment) const {
    JsonKind kind = kindOf(current);
    switch (kind) {
    case JsonKind::Array:
        if (segment.indexOverflow || segment.index >= current.size()) {
            LOG_WARN << "Array index out of bounds: " << segment.indexText << " (array length: " << current.size() << ")";
            throw ServiceError(ErrorKind::BadRequest, "Array index out of bounds: " + segment.indexText);
        }
        return current[static_cast<Json::ArrayIndex>(segment.index)];
    case JsonKind::Null:
    case JsonKind::Boolean:
    case JsonKind::Number:
    case JsonKind::String:
    case JsonKind::Object:
        break;
    }
    LOG_WARN << "Cannot index - not an array, type is " << kindName(kind);
    throw ServiceError(ErrorKind::BadRequest, "Cannot index - not an array");
}
