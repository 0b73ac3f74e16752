#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <json/json.h>
#include "../src/ViewerConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p);
    ofs << content;
}

int main() {
    try {
        auto base = fs::temp_directory_path() / "docview_config_test";
        fs::remove_all(base);
        fs::create_directories(base / "docs");

        // Defaults
        ViewerConfig defaults;
        ASSERT_TRUE(defaults.allowedExtensions.count(".md") == 1);
        ASSERT_TRUE(defaults.allowedExtensions.count(".json") == 1);
        ASSERT_TRUE(defaults.allowedExtensions.size() == 2);
        ASSERT_TRUE(defaults.excludedDirectories.count("node_modules") == 1);
        ASSERT_TRUE(defaults.ignoreHidden);
        ASSERT_TRUE(defaults.readOnly);
        ASSERT_TRUE(defaults.modeName() == "read-only");
        ASSERT_TRUE(defaults.isAllowedExtension("a/B.Md"));
        ASSERT_TRUE(!defaults.isAllowedExtension("a/b.txt"));
        ASSERT_TRUE(!defaults.isAllowedExtension("README"));
        ASSERT_TRUE(lowerExtension("x/Y.JSON") == ".json");

        // Missing file: defaults rooted at the working directory
        ViewerConfig missing = loadViewerConfig((base / "absent.json").string());
        ASSERT_TRUE(missing.rootDirectory == fs::canonical(fs::current_path()));
        ASSERT_TRUE(missing.port == 8080);
        ASSERT_TRUE(!missing.hasListeners);

        // Full viewer section
        std::string full = R"({
            "listeners": [{"address": "0.0.0.0", "port": 9000}],
            "viewer": {
                "root": ")" + (base / "docs").string() + R"(",
                "port": 9090,
                "threads": 4,
                "read_only": false,
                "ignore_hidden": false,
                "allowed_extensions": ["MD", ".txt"],
                "excluded_directories": ["vendor"],
                "log_level": "debug"
            }
        })";
        writeFile(base / "full.json", full);
        ViewerConfig loaded = loadViewerConfig((base / "full.json").string());
        ASSERT_TRUE(loaded.rootDirectory == fs::canonical(base / "docs"));
        ASSERT_TRUE(loaded.port == 9090);
        ASSERT_TRUE(loaded.threads == 4);
        ASSERT_TRUE(!loaded.readOnly);
        ASSERT_TRUE(loaded.modeName() == "read-write");
        ASSERT_TRUE(!loaded.ignoreHidden);
        ASSERT_TRUE(loaded.hasListeners);
        ASSERT_TRUE(loaded.logLevel == "debug");
        ASSERT_TRUE(loaded.allowedExtensions.size() == 2);
        ASSERT_TRUE(loaded.allowedExtensions.count(".md") == 1);
        ASSERT_TRUE(loaded.allowedExtensions.count(".txt") == 1);
        ASSERT_TRUE(loaded.excludedDirectories.size() == 1);
        ASSERT_TRUE(loaded.excludedDirectories.count("vendor") == 1);

        // Relative roots resolve against the working directory
        Json::Value relative;
        relative["viewer"]["root"] = "some/where";
        ViewerConfig partial;
        applyViewerSection(relative, partial);
        ASSERT_TRUE(partial.rootDirectory == fs::path("some/where"));
        ASSERT_TRUE(partial.port == 8080);

        // Failures
        bool threw = false;
        writeFile(base / "broken.json", "{ \"viewer\": ");
        try {
            loadViewerConfig((base / "broken.json").string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        threw = false;
        writeFile(base / "noroot.json", R"({"viewer": {"root": ")" + (base / "nowhere").string() + R"("}})");
        try {
            loadViewerConfig((base / "noroot.json").string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        threw = false;
        Json::Value badList;
        badList["viewer"]["allowed_extensions"] = ".md";
        try {
            ViewerConfig c;
            applyViewerSection(badList, c);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        threw = false;
        writeFile(base / "badtype.json", R"({"viewer": {"port": "eighty"}})");
        try {
            loadViewerConfig((base / "badtype.json").string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        for (int port : {0, 70000, -1}) {
            threw = false;
            Json::Value outOfRange;
            outOfRange["viewer"]["port"] = port;
            try {
                ViewerConfig c;
                applyViewerSection(outOfRange, c);
            } catch (const std::runtime_error&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
        }
        Json::Value highest;
        highest["viewer"]["port"] = 65535;
        ViewerConfig highestConfig;
        applyViewerSection(highest, highestConfig);
        ASSERT_TRUE(highestConfig.port == 65535);

        fs::remove_all(base);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All config tests passed" << std::endl;
    return 0;
}
