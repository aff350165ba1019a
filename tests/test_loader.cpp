/**
 * @file test_loader.cpp
 * @brief Unit tests for JSON/TOML file loading (GoogleTest)
 *
 * Covers:
 * - load_json_file / load_toml_file / parse_toml
 * - load_tree_file format detection by extension
 * - missing files, malformed content, unsupported extensions
 * - decoding a loaded tree, including TOML dates
 */

#include <gtest/gtest.h>

#include "unbox/Decode.hpp"
#include "unbox/Errors.hpp"
#include "unbox/Formatter.hpp"
#include "unbox/Loader.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace unbox;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_, std::ios::binary);
        f << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

namespace {

struct Server {
    explicit Server(Unboxer& unboxer)
        : host(unboxer.required<std::string>("host"))
        , port(unboxer.required<std::uint16_t>("port"))
        , debug(unboxer.optional<bool>("debug"))
    {}

    std::string host;
    std::uint16_t port;
    std::optional<bool> debug;
};

} // anonymous namespace

// ============================================================================
// load_json_file
// ============================================================================

TEST(LoadJsonTest, SimpleObject) {
    TempFile file("unbox_test_simple.json", R"({"name": "test", "count": 3, "tags": ["a", "b"]})");

    Value tree = load_json_file(file.path());
    EXPECT_EQ(tree["name"], "test");
    EXPECT_EQ(tree["count"], 3);
    EXPECT_EQ(tree["tags"].size(), 2u);
}

TEST(LoadJsonTest, FileNotFound) {
    EXPECT_THROW(load_json_file("/nonexistent/unbox_missing.json"), FileNotFoundError);
}

TEST(LoadJsonTest, MalformedContent) {
    TempFile file("unbox_test_bad.json", R"({"name": "test", )");

    try {
        load_json_file(file.path());
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeError::Kind::InvalidInputData);
        EXPECT_NE(e.details().find(file.path()), std::string::npos);
    }
}

// ============================================================================
// load_toml_file / parse_toml
// ============================================================================

TEST(LoadTomlTest, TablesBecomeObjects) {
    TempFile file("unbox_test_simple.toml",
        "title = \"demo\"\n"
        "\n"
        "[server]\n"
        "host = \"localhost\"\n"
        "port = 8080\n"
        "ratio = 0.5\n"
        "enabled = true\n"
        "\n"
        "[server.limits]\n"
        "sizes = [1, 2, 3]\n");

    Value tree = load_toml_file(file.path());
    EXPECT_EQ(tree["title"], "demo");
    EXPECT_EQ(tree["server"]["host"], "localhost");
    EXPECT_EQ(tree["server"]["port"], 8080);
    EXPECT_DOUBLE_EQ(tree["server"]["ratio"].get<double>(), 0.5);
    EXPECT_EQ(tree["server"]["enabled"], true);
    EXPECT_EQ(tree["server"]["limits"]["sizes"], Value::array({1, 2, 3}));
}

TEST(LoadTomlTest, InlineTablesAndArraysOfTables) {
    Value tree = parse_toml(
        "point = { x = 1, y = 2 }\n"
        "[[items]]\n"
        "name = \"a\"\n"
        "[[items]]\n"
        "name = \"b\"\n");

    EXPECT_EQ(tree["point"]["y"], 2);
    ASSERT_TRUE(tree["items"].is_array());
    EXPECT_EQ(tree["items"][1]["name"], "b");
}

TEST(LoadTomlTest, DatesBecomeStrings) {
    Value tree = parse_toml("released = 2017-03-14\n");
    ASSERT_TRUE(tree["released"].is_string());
    EXPECT_EQ(tree["released"], "2017-03-14");
}

TEST(LoadTomlTest, FileNotFound) {
    EXPECT_THROW(load_toml_file("/nonexistent/unbox_missing.toml"), FileNotFoundError);
}

TEST(LoadTomlTest, MalformedContent) {
    try {
        parse_toml("key = \n[unterminated", "inline.toml");
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeError::Kind::InvalidInputData);
        EXPECT_EQ(e.details().rfind("inline.toml:", 0), 0u);
    }
}

// ============================================================================
// load_tree_file
// ============================================================================

TEST(LoadTreeFileTest, DetectsFormatByExtension) {
    TempFile json("unbox_test_detect.json", R"({"format": "json"})");
    TempFile toml("unbox_test_detect.toml", "format = \"toml\"\n");

    EXPECT_EQ(load_tree_file(json.path())["format"], "json");
    EXPECT_EQ(load_tree_file(toml.path())["format"], "toml");
}

TEST(LoadTreeFileTest, ExtensionIsCaseInsensitive) {
    TempFile json("unbox_test_upper.JSON", R"({"ok": true})");
    EXPECT_EQ(load_tree_file(json.path())["ok"], true);
    EXPECT_EQ(get_file_extension("a/b/C.ToMl"), ".toml");
    EXPECT_EQ(get_file_extension("no_extension"), "");
}

TEST(LoadTreeFileTest, UnsupportedExtension) {
    TempFile yaml("unbox_test_config.yaml", "key: value\n");

    try {
        load_tree_file(yaml.path());
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeError::Kind::InvalidInputData);
        EXPECT_NE(e.details().find(".yaml"), std::string::npos);
    }
}

TEST(LoadTreeFileTest, FileNotFound) {
    EXPECT_THROW(load_tree_file("/nonexistent/unbox_missing.json"), FileNotFoundError);
}

// ============================================================================
// Decoding loaded trees
// ============================================================================

TEST(LoadAndDecodeTest, JsonAndTomlDecodeAlike) {
    TempFile json("unbox_test_server.json", R"({"server": {"host": "db", "port": 5432}})");
    TempFile toml("unbox_test_server.toml", "[server]\nhost = \"db\"\nport = 5432\n");

    auto from_json = decode_at<Server>(load_tree_file(json.path()), "server");
    auto from_toml = decode_at<Server>(load_tree_file(toml.path()), "server");

    ASSERT_TRUE(from_json.ok());
    ASSERT_TRUE(from_toml.ok());
    EXPECT_EQ(from_json.value().host, from_toml.value().host);
    EXPECT_EQ(from_json.value().port, 5432);
    EXPECT_EQ(from_toml.value().port, 5432);
    EXPECT_FALSE(from_toml.value().debug.has_value());
}

TEST(LoadAndDecodeTest, TomlPortOutOfRange) {
    Value tree = parse_toml("[server]\nhost = \"db\"\nport = 70000\n");

    auto result = decode_at<Server>(tree, "server");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().path(), "server.port");
    EXPECT_EQ(result.error().path_error()->expected_type(), "uint16");
}

TEST(LoadAndDecodeTest, TomlDateThroughFormatter) {
    Value tree = parse_toml("released = 2017-03-14\n");
    DateFormatter formatter("%Y-%m-%d");

    auto result = decode_custom<std::string>(tree, [&formatter](Unboxer& unboxer) -> std::optional<std::string> {
        return format_time(unboxer.required_formatted("released", formatter), "%Y-%m-%d");
    });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), "2017-03-14");
}
