// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <hiegraph/config/config_helpers.h>
#include <hiegraph/config/extraction_config.h>
#include "../../common/test_helpers_catch2.h"

using namespace hiegraph;
using namespace hiegraph::config;
using hiegraph::test::ScopedEnvVar;
using hiegraph::test::ScopedTempDir;
using hiegraph::test::write_file;

TEST_CASE("Config value parsing", "[config][helpers]") {
    ScopedTempDir dir;
    auto path = write_file(dir.path() / "config.toml", R"(# hiegraph settings
top = "root"

[log]
level = "debug"
file = '~/hiegraph.log'

[input]
extension = .json # inline comment
output.format = json
)");

    CHECK(parse_config_value(path, "log", "level") == "debug");
    CHECK(parse_config_value(path, "log", "file") == "~/hiegraph.log");
    CHECK(parse_config_value(path, "input", "extension") == ".json");
    CHECK(parse_config_value(path, "", "top") == "root");

    SECTION("dotted keys name their section") {
        CHECK(parse_config_value(path, "output", "format") == "json");
    }

    SECTION("keys of other sections do not leak") {
        CHECK(parse_config_value(path, "input", "level").empty());
    }

    SECTION("missing file yields empty values") {
        CHECK(parse_config_value(dir.path() / "absent.toml", "log", "level").empty());
    }
}

TEST_CASE("Config string helpers", "[config][helpers]") {
    CHECK(unquote("  \"quoted\" ") == "quoted");
    CHECK(unquote("'single'") == "single");
    CHECK(unquote("bare") == "bare");

    CHECK(parse_bool("Yes") == std::optional<bool>{true});
    CHECK(parse_bool(" off ") == std::optional<bool>{false});
    CHECK_FALSE(parse_bool("maybe").has_value());

    ScopedEnvVar home("HOME", std::string("/home/tester"));
    CHECK(expand_tilde("~/x.log") == std::filesystem::path("/home/tester/x.log"));
    CHECK(expand_tilde("/abs/x.log") == std::filesystem::path("/abs/x.log"));
    CHECK(expand_tilde("~") == std::filesystem::path("/home/tester"));
    CHECK(expand_tilde("~/") == std::filesystem::path("/home/tester"));
    CHECK(expand_tilde("~foo/x.log") == std::filesystem::path("~foo/x.log"));
}

TEST_CASE("Config path resolution", "[config][helpers]") {
    SECTION("XDG config home") {
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/xdg"));
        ScopedEnvVar env("HIEGRAPH_CONFIG", std::nullopt);
        CHECK(resolve_config_path() == std::filesystem::path("/xdg/hiegraph/config.toml"));
    }

    SECTION("environment override") {
        ScopedEnvVar env("HIEGRAPH_CONFIG", std::string("/etc/hiegraph.toml"));
        CHECK(resolve_config_path() == std::filesystem::path("/etc/hiegraph.toml"));
    }

    SECTION("explicit path wins") {
        ScopedEnvVar env("HIEGRAPH_CONFIG", std::string("/etc/hiegraph.toml"));
        CHECK(resolve_config_path("/tmp/mine.toml") == std::filesystem::path("/tmp/mine.toml"));
    }
}

TEST_CASE("Extraction config loading", "[config][extraction]") {
    ScopedTempDir dir;
    ScopedEnvVar level("HIEGRAPH_LOG_LEVEL", std::nullopt);

    SECTION("defaults without a config file") {
        auto config = loadExtractionConfig(dir.path() / "absent.toml");
        REQUIRE(config);
        CHECK(config.value().logLevel == "warn");
        CHECK(config.value().inputExtension == ".hie.json");
        CHECK(config.value().format == OutputFormat::Text);
        CHECK_FALSE(config.value().dumpHieFile);
        CHECK(config.value().dumpParsed);
    }

    SECTION("file values override defaults") {
        auto path = write_file(dir.path() / "config.toml", R"([log]
level = "info"

[input]
extension = ".hie.export"

[output]
format = "json"

[debug]
dump_hie_file = true
dump_parsed = no
)");
        auto config = loadExtractionConfig(path);
        REQUIRE(config);
        CHECK(config.value().logLevel == "info");
        CHECK(config.value().inputExtension == ".hie.export");
        CHECK(config.value().format == OutputFormat::Json);
        CHECK(config.value().dumpHieFile);
        CHECK_FALSE(config.value().dumpParsed);
    }

    SECTION("environment overrides the file") {
        auto path = write_file(dir.path() / "config.toml", "[log]\nlevel = \"info\"\n");
        ScopedEnvVar env("HIEGRAPH_LOG_LEVEL", std::string("trace"));
        auto config = loadExtractionConfig(path);
        REQUIRE(config);
        CHECK(config.value().logLevel == "trace");
    }

    SECTION("invalid values are rejected") {
        auto badFormat = write_file(dir.path() / "format.toml", "[output]\nformat = dot\n");
        auto format = loadExtractionConfig(badFormat);
        REQUIRE_FALSE(format);
        CHECK(format.error().code == ErrorCode::InvalidArgument);

        auto badBool = write_file(dir.path() / "bool.toml", "[debug]\ndump_parsed = sometimes\n");
        auto flag = loadExtractionConfig(badBool);
        REQUIRE_FALSE(flag);
        CHECK(flag.error().code == ErrorCode::InvalidArgument);

        auto badLevel = write_file(dir.path() / "level.toml", "[log]\nlevel = loud\n");
        auto logLevel = loadExtractionConfig(badLevel);
        REQUIRE(logLevel);
        auto valid = validateExtractionConfig(logLevel.value());
        REQUIRE_FALSE(valid);
        CHECK(valid.error().code == ErrorCode::InvalidArgument);

        ExtractionConfig noExtension;
        noExtension.inputExtension.clear();
        CHECK_FALSE(validateExtractionConfig(noExtension));
    }

    SECTION("a bad environment level can still be overridden") {
        ScopedEnvVar env("HIEGRAPH_LOG_LEVEL", std::string("loud"));
        auto config = loadExtractionConfig(dir.path() / "absent.toml");
        REQUIRE(config);
        CHECK(config.value().logLevel == "loud");
        CHECK_FALSE(validateExtractionConfig(config.value()));

        config.value().logLevel = "debug";
        CHECK(validateExtractionConfig(config.value()));
    }

    SECTION("output format names") {
        CHECK(parseOutputFormat("text").value() == OutputFormat::Text);
        CHECK(parseOutputFormat("json").value() == OutputFormat::Json);
        CHECK_FALSE(parseOutputFormat("yaml"));
        CHECK(isValidLogLevel("off"));
        CHECK_FALSE(isValidLogLevel("verbose"));
    }
}
