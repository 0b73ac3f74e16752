#include "FileEntry.hpp"
#include <trantor/utils/Date.h>

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
    return trantor::Date(micros).toCustomedFormattedString("%Y-%m-%dT%H:%M:%SZ");
}

Json::Value FileEntry::toJson() const {
    Json::Value entry;
    entry["name"] = name;
    entry["path"] = relativePath;
    entry["isDir"] = isDirectory;
    entry["size"] = (Json::Int64)sizeBytes;
    entry["modTime"] = formatTimestamp(modifiedAt);
    return entry;
}
