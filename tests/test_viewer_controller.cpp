#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>
#include <json/json.h>
#include "../src/ViewerController.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << content;
}

template <typename F>
static int statusOf(F&& fn) {
    try {
        fn();
    } catch (const ServiceError& e) {
        return e.httpStatus();
    }
    return 200;
}

int main() {
    try {
        auto base = fs::temp_directory_path() / "docview_controller_test";
        fs::remove_all(base);
        auto root = base / "root";
        writeFile(root / "README.md", "# Root\n");
        writeFile(root / "config.json", R"({"server":{"ports":[80,443]},"name":"demo"})");
        writeFile(root / "docs" / "notes.md", "notes\n");
        writeFile(root / "docs" / "api.json", R"({"endpoints":[{"path":"/a"},{"path":"/b"}]})");
        writeFile(root / "docs" / "sub" / "leaf.md", "leaf\n");
        writeFile(root / "docs" / "sub" / "table.csv", "a,b\n");
        writeFile(base / "secret.json", R"({"key":"value"})");

        ViewerConfig config;
        config.rootDirectory = fs::canonical(root);
        ViewerController controller(config);

        // Listing the root
        Json::Value top = controller.listFiles("");
        ASSERT_TRUE(top.isArray());
        ASSERT_TRUE(top.size() == 3);
        ASSERT_TRUE(top[0]["name"].asString() == "docs");
        ASSERT_TRUE(top[0]["isDir"].asBool());
        ASSERT_TRUE(top[1]["name"].asString() == "README.md");
        ASSERT_TRUE(top[2]["name"].asString() == "config.json");

        // Listing one level down, following the returned path
        Json::Value docs = controller.listFiles(top[0]["path"].asString());
        ASSERT_TRUE(docs.size() == 3);
        ASSERT_TRUE(docs[0]["name"].asString() == "sub");
        ASSERT_TRUE(docs[0]["path"].asString() == "sub");
        ASSERT_TRUE(docs[1]["name"].asString() == "api.json");
        ASSERT_TRUE(docs[2]["name"].asString() == "notes.md");

        ASSERT_TRUE(statusOf([&] { controller.listFiles("nowhere"); }) == 404);
        ASSERT_TRUE(statusOf([&] { controller.listFiles("README.md"); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.listFiles(".."); }) == 400);

        // Content through each resolution strategy
        FileContent readme = controller.getContent("README.md", "");
        ASSERT_TRUE(readme.bytes == "# Root\n");
        ASSERT_TRUE(readme.contentType == "text/plain");
        ASSERT_TRUE(controller.getContent("notes.md", "").bytes == "notes\n");
        ASSERT_TRUE(controller.getContent("leaf.md", "docs/sub").bytes == "leaf\n");
        ASSERT_TRUE(controller.getContent("docs/sub/leaf.md", "").bytes == "leaf\n");
        FileContent api = controller.getContent("api.json", "docs");
        ASSERT_TRUE(api.contentType == "application/json");

        ASSERT_TRUE(statusOf([&] { controller.getContent("leaf.md", ""); }) == 404);
        ASSERT_TRUE(statusOf([&] { controller.getContent("docs/sub/table.csv", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.getContent("../secret.json", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.getContent("", ""); }) == 400);

        // Queries
        Json::Value port = controller.queryJson("config.json", "server.ports[1]", "");
        ASSERT_TRUE(port.asInt() == 443);
        Json::Value endpoint = controller.queryJson("api.json", "endpoints[0]", "docs");
        ASSERT_TRUE(endpoint["path"].asString() == "/a");
        ASSERT_TRUE(controller.queryJson("api.json", "endpoints[1].path", "").asString() == "/b");
        ASSERT_TRUE(controller.queryJson("config.json", "missing.deeper", "").isNull());
        ASSERT_TRUE(controller.queryJson("config.json", "server", "") == controller.queryJson("config.json", "server", ""));

        ASSERT_TRUE(statusOf([&] { controller.queryJson("config.json", "server.ports[7]", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.queryJson("config.json", "name.first", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.queryJson("README.md", "anything", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.queryJson("notes.md", "", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.queryJson("", "a", ""); }) == 400);
        ASSERT_TRUE(statusOf([&] { controller.queryJson("nothing.json", "a", ""); }) == 404);
        ASSERT_TRUE(statusOf([&] { controller.queryJson("../secret.json", "key", ""); }) == 400);

        // Every listed entry can be followed, symlinks leaving the root are hidden
        writeFile(base / "outdir" / "away.md", "away\n");
        writeFile(base / "outdir" / "notes.md", "outside\n");
        std::error_code linkEc;
        fs::create_directory_symlink(base / "outdir", root / "archive", linkEc);
        fs::create_symlink(base / "secret.json", root / "linked.json", linkEc);
        Json::Value linkedTop = controller.listFiles("");
        ASSERT_TRUE(linkedTop.size() == 3);
        for (const auto& entry : linkedTop) {
            std::string path = entry["path"].asString();
            if (entry["isDir"].asBool()) {
                ASSERT_TRUE(statusOf([&] { controller.listFiles(path); }) == 200);
            } else {
                ASSERT_TRUE(statusOf([&] { controller.getContent(path, ""); }) == 200);
            }
        }
        // The in-root copy wins over the linked directory that sorts first
        ASSERT_TRUE(controller.getContent("notes.md", "").bytes == "notes\n");
        ASSERT_TRUE(statusOf([&] { controller.getContent("away.md", ""); }) == 400);

        // Error body shape
        Json::Value err = controller.createError(ServiceError(ErrorKind::NotFound, "File not found: x.md"));
        ASSERT_TRUE(err["error"]["code"].asString() == "not_found");
        ASSERT_TRUE(err["error"]["message"].asString() == "File not found: x.md");
        ASSERT_TRUE(ServiceError(ErrorKind::Internal, "io").httpStatus() == 500);
        ASSERT_TRUE(ServiceError(ErrorKind::BadRequest, "bad").code() == "bad_request");

        fs::remove_all(base);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All viewer controller tests passed" << std::endl;
    return 0;
}
