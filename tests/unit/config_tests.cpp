#include <doctest/doctest.h>
#include <stackreg/config.hpp>

#include "../test_helpers.hpp"

using namespace stackreg;
using stackreg::testing::TempTestDir;
using stackreg::testing::fixed_env;
using stackreg::testing::write_file;

TEST_CASE("parse_config_file reads a full document") {
    auto result = parse_config_file(R"({
        "$schema": "stackreg.config.v1",
        "region": "eu-west-1",
        "package_root": "cdk/platform",
        "artifact_root": "build",
        "output_dir": "out",
        "warnings": {"artifact_missing": "error", "Stage_Invalid": "ignore"}
    })", "/etc/stackreg.json");

    REQUIRE(result.ok);
    CHECK(result.config.source_path == "/etc/stackreg.json");
    CHECK(result.config.region == std::optional<std::string>("eu-west-1"));
    CHECK(result.config.package_root == std::optional<std::string>("cdk/platform"));
    CHECK(result.config.artifact_root == std::optional<std::string>("build"));
    CHECK(result.config.output_dir == std::optional<std::string>("out"));
    CHECK(result.config.warnings.at("artifact_missing") == WarningAction::Error);
    CHECK(result.config.warnings.at("stage_invalid") == WarningAction::Ignore);
    CHECK(result.warnings.empty());
}

TEST_CASE("parse_config_file rejects malformed documents") {
    SUBCASE("not JSON") {
        auto result = parse_config_file("{oops");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("parse error") == 0);
    }
    SUBCASE("not an object") {
        CHECK(parse_config_file("[]").error == "JSON must be an object");
    }
    SUBCASE("schema missing") {
        CHECK(parse_config_file("{}").error == "$schema missing");
    }
    SUBCASE("schema mismatch") {
        auto result = parse_config_file(R"({"$schema": "other.v2"})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("$schema mismatch") == 0);
    }
}

TEST_CASE("parse_config_file collects invalid entries as warnings") {
    auto result = parse_config_file(R"({
        "$schema": "stackreg.config.v1",
        "region": 12,
        "warnings": {"artifact_missing": "loud", "not_a_key": "warn"}
    })");

    REQUIRE(result.ok);
    CHECK_FALSE(result.config.region.has_value());
    CHECK(result.config.warnings.empty());
    REQUIRE(result.warnings.size() == 3);
    CHECK(result.warnings[0] == "invalid_configuration:invalid_region");
}

TEST_CASE("load_driver_config requires a region") {
    ConfigSources sources;
    sources.env = fixed_env({});
    auto config = load_driver_config(sources);
    REQUIRE(config.isErr());
    CHECK(config.error().code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(config.error().message() == "AWS_REGION environment variable is not set");

    sources.require_region = false;
    auto relaxed = load_driver_config(sources);
    REQUIRE(relaxed.isOk());
    CHECK(relaxed.value().region.empty());
}

TEST_CASE("load_driver_config reads the environment") {
    TempTestDir dir;
    ConfigSources sources;
    sources.env = fixed_env({
        {"AWS_REGION", " us-east-1 "},
        {"STACK", "api,web"},
        {"STACKREG_PACKAGE_ROOT", dir.path},
    });

    auto config = load_driver_config(sources);
    REQUIRE(config.isOk());
    CHECK(config.value().region == "us-east-1");
    CHECK(config.value().stack_selection == std::optional<std::string>("api,web"));
    CHECK(config.value().package_root == dir.path);
    CHECK(config.value().artifact_root.empty());
    CHECK(config.value().output_dir == dir.path + "/cdktf.out");
    CHECK(config.value().config_path.empty());
}

TEST_CASE("environment beats the config file and paths resolve against it") {
    TempTestDir dir;
    write_file(dir.file("conf/stackreg.json"), R"({
        "$schema": "stackreg.config.v1",
        "region": "eu-west-1",
        "package_root": "../pkg",
        "artifact_root": "artifacts",
        "warnings": {"artifact_missing": "error", "bogus": "warn"}
    })");

    ConfigSources sources;
    sources.env = fixed_env({{"AWS_REGION", "us-west-2"}});
    sources.config_path = dir.file("conf/stackreg.json");

    auto config = load_driver_config(sources);
    REQUIRE(config.isOk());
    CHECK(config.value().region == "us-west-2");
    CHECK(config.value().package_root == dir.file("pkg"));
    CHECK(config.value().artifact_root == dir.file("conf/artifacts"));
    CHECK(config.value().output_dir == dir.file("pkg/cdktf.out"));
    CHECK(config.value().warnings.at("artifact_missing") == WarningAction::Error);
    REQUIRE(config.value().config_warnings.size() == 1);
    CHECK(config.value().config_warnings[0] == "unknown_warning_key:bogus");

    WarningCollector warnings(config.value().warnings);
    report_config_warnings(config.value(), warnings);
    auto emitted = warnings.get_warnings(Warning::invalid_configuration);
    REQUIRE(emitted.size() == 1);
    CHECK(emitted[0].fields.at("source_path") == dir.file("conf/stackreg.json"));
}

TEST_CASE("the config file supplies the region when the environment does not") {
    TempTestDir dir;
    write_file(dir.file("stackreg.json"),
               R"({"$schema": "stackreg.config.v1", "region": "ap-southeast-2"})");

    ConfigSources sources;
    sources.env = fixed_env({});
    sources.config_path = dir.file("stackreg.json");
    sources.package_root = dir.path;

    auto config = load_driver_config(sources);
    REQUIRE(config.isOk());
    CHECK(config.value().region == "ap-southeast-2");
    CHECK(config.value().package_root == dir.path);
}

TEST_CASE("an unreadable or malformed config file is a configuration error") {
    TempTestDir dir;
    ConfigSources sources;
    sources.env = fixed_env({{"AWS_REGION", "us-east-1"}});

    sources.config_path = dir.file("missing.json");
    auto missing = load_driver_config(sources);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::CONFIGURATION_ERROR);

    write_file(dir.file("bad.json"), "[1, 2]");
    sources.config_path = dir.file("bad.json");
    auto bad = load_driver_config(sources);
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(bad.error().message().find("JSON must be an object") != std::string::npos);
}
