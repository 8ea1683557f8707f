#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace shapesql;

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.output.format == "sql");
    CHECK(result.config.output.schema.empty());
    CHECK_FALSE(result.config.output.if_not_exists);
    CHECK(result.config.output.file.empty());
    CHECK(result.config.shape_paths.empty());
}

TEST_CASE("ConfigLoader: full document", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[output]
format = "JSON"
schema = "app"
if_not_exists = true
file = "out.sql"

[[shapes]]
path = "shapes/user.json"

[[shapes]]
path = "shapes/post.json"
)";
    auto result = ConfigLoader::load_from_string(toml);
    INFO(result.error_message);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "debug");
    CHECK(result.config.output.format == "json");
    CHECK(result.config.output.schema == "app");
    CHECK(result.config.output.if_not_exists);
    CHECK(result.config.output.file == "out.sql");
    REQUIRE(result.config.shape_paths.size() == 2);
    CHECK(result.config.shape_paths[1] == "shapes/post.json");
}

TEST_CASE("ConfigValidation: invalid log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"loud\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: invalid output format fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[output]\nformat = \"yaml\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("output.format") != std::string::npos);
}

TEST_CASE("ConfigValidation: empty shape path fails", "[config][validation]") {
    const std::string toml = R"(
[[shapes]]
path = "a.json"

[[shapes]]
path = ""
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("shapes[1].path") != std::string::npos);
}

TEST_CASE("ConfigValidation: all errors are reported together", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "loud"

[output]
format = "yaml"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("output.format") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[output\nformat = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: env var expansion", "[config]") {
    ::setenv("SHAPESQL_TEST_SCHEMA", "tenant_a", 1);
    auto result = ConfigLoader::load_from_string("[output]\nschema = \"${SHAPESQL_TEST_SCHEMA}\"\n");
    ::unsetenv("SHAPESQL_TEST_SCHEMA");
    REQUIRE(result.success);
    CHECK(result.config.output.schema == "tenant_a");

    SECTION("Unset variable expands to empty") {
        auto unset = ConfigLoader::load_from_string("[output]\nschema = \"x${SHAPESQL_TEST_UNSET_VAR}y\"\n");
        REQUIRE(unset.success);
        CHECK(unset.config.output.schema == "xy");
    }

    SECTION("Unclosed substitution fails") {
        auto bad = ConfigLoader::load_from_string("[output]\nschema = \"${OOPS\"\n");
        CHECK_FALSE(bad.success);
    }
}

TEST_CASE("ConfigLoader: env vars inside shape arrays", "[config]") {
    ::setenv("SHAPESQL_TEST_DIR", "/srv/shapes", 1);
    ::setenv("SHAPESQL_TEST_NAME", "user", 1);
    const std::string toml = R"(
[[shapes]]
path = "${SHAPESQL_TEST_DIR}/${SHAPESQL_TEST_NAME}.json"

[[shapes]]
path = "plain.json"
)";
    auto result = ConfigLoader::load_from_string(toml);
    ::unsetenv("SHAPESQL_TEST_DIR");
    ::unsetenv("SHAPESQL_TEST_NAME");

    INFO(result.error_message);
    REQUIRE(result.success);
    REQUIRE(result.config.shape_paths.size() == 2);
    CHECK(result.config.shape_paths[0] == "/srv/shapes/user.json");
    CHECK(result.config.shape_paths[1] == "plain.json");
}

TEST_CASE("ConfigLoader: files", "[config]") {
    namespace fs = std::filesystem;

    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/shapesql.toml");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to load config") != std::string::npos);
    }

    SECTION("Relative shape paths resolve against the config directory") {
        const fs::path dir = fs::temp_directory_path() / "shapesql_config_test";
        fs::create_directories(dir);
        const fs::path file = dir / "shapesql.toml";
        {
            std::ofstream out(file);
            out << "[[shapes]]\npath = \"shapes/user.json\"\n\n[[shapes]]\npath = \"/abs/post.json\"\n";
        }
        auto result = ConfigLoader::load_from_file(file.string());
        fs::remove_all(dir);

        INFO(result.error_message);
        REQUIRE(result.success);
        REQUIRE(result.config.shape_paths.size() == 2);
        CHECK(result.config.shape_paths[0] == (dir / "shapes/user.json").lexically_normal().string());
        CHECK(result.config.shape_paths[1] == "/abs/post.json");
    }
}
