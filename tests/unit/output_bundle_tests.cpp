#include <doctest/doctest.h>
#include <stackreg/catalog.hpp>
#include <stackreg/consumers.hpp>
#include <stackreg/output_bundle.hpp>
#include <stackreg/platform.hpp>

#include "../test_helpers.hpp"

using namespace stackreg;
using stackreg::testing::ScopedWorkingDirectory;
using stackreg::testing::TempTestDir;
using stackreg::testing::fixed_env;
using stackreg::testing::write_file;

TEST_CASE("bundle_outputs copies outputs.json files and keeps the layout") {
    TempTestDir platform;
    TempTestDir service;
    std::string outputs = platform.file("cdktf-outputs");
    write_file(outputs + "/stacks/api-stack/outputs.json", R"({"api-stack": {}})");
    write_file(outputs + "/stacks/web-stack/outputs.json", R"({"web-stack": {}})");
    write_file(outputs + "/stacks/web-stack/plan.log", "ignored");
    create_directories(service.file("dist"));

    auto bundled = bundle_outputs(outputs, service.file("dist"));
    REQUIRE(bundled.isOk());
    CHECK(bundled.value().source_found);
    CHECK(bundled.value().dest_root == service.file("dist/cdktf-outputs"));
    CHECK(bundled.value().copied == std::vector<std::string>{
        "stacks/api-stack/outputs.json", "stacks/web-stack/outputs.json"});

    CHECK(read_file(service.file("dist/cdktf-outputs/stacks/api-stack/outputs.json")) ==
          std::optional<std::string>(R"({"api-stack": {}})"));
    CHECK_FALSE(path_exists(service.file("dist/cdktf-outputs/stacks/web-stack/plan.log")));
}

TEST_CASE("bundle_outputs replaces earlier copies") {
    TempTestDir platform;
    TempTestDir service;
    std::string outputs = platform.file("cdktf-outputs");
    write_file(outputs + "/stacks/api-stack/outputs.json", "new");
    write_file(service.file("dist/cdktf-outputs/stacks/api-stack/outputs.json"), "old");

    REQUIRE(bundle_outputs(outputs, service.file("dist")).isOk());
    CHECK(read_file(service.file("dist/cdktf-outputs/stacks/api-stack/outputs.json")) ==
          std::optional<std::string>("new"));
}

TEST_CASE("a missing outputs directory is reported but not an error") {
    TempTestDir platform;
    TempTestDir service;

    auto bundled = bundle_outputs(platform.file("cdktf-outputs"), service.file("dist"));
    REQUIRE(bundled.isOk());
    CHECK_FALSE(bundled.value().source_found);
    CHECK(bundled.value().copied.empty());
    CHECK_FALSE(path_exists(service.file("dist")));
}

TEST_CASE("a missing dist directory is an error") {
    TempTestDir platform;
    TempTestDir service;
    write_file(platform.file("cdktf-outputs/stacks/api-stack/outputs.json"), "{}");

    auto bundled = bundle_outputs(platform.file("cdktf-outputs"), service.file("dist"));
    REQUIRE(bundled.isErr());
    CHECK(bundled.error().code() == ErrorCode::IO_ERROR);
    CHECK(bundled.error().message().find(service.file("dist")) != std::string::npos);
}

TEST_CASE("an empty outputs directory copies nothing") {
    TempTestDir platform;
    TempTestDir service;
    create_directories(platform.file("cdktf-outputs"));
    create_directories(service.file("dist"));

    auto bundled = bundle_outputs(platform.file("cdktf-outputs"), service.file("dist"));
    REQUIRE(bundled.isOk());
    CHECK(bundled.value().source_found);
    CHECK(bundled.value().copied.empty());
    CHECK(path_exists(service.file("dist/cdktf-outputs")));
}

TEST_CASE("a bundled service reads its outputs from the dist directory") {
    TempTestDir platform;
    TempTestDir service;
    write_file(resolve_output_path(API_STACK, platform.path), nlohmann::json{{API_STACK, {
        {"userTableName", "users"},
        {"verificationTableName", "verification"},
        {"rateLimitTableName", "rate-limit"},
        {"denyListTableName", "deny-list"},
    }}}.dump());
    create_directories(service.file("dist"));

    REQUIRE(bundle_outputs(platform.file(OUTPUTS_ROOT), service.file("dist")).isOk());

    auto registry = std::make_shared<const StackRegistry>(
        StackRegistry::create(build_default_catalog(fixed_env({}), platform.path)).value());
    OutputLoader loader(registry, platform.path);

    ScopedWorkingDirectory cwd(service.file("dist"));
    auto api = loader.load_as<ApiStackOutputs>(API_STACK, service_outputs_base(true));
    REQUIRE(api.isOk());
    CHECK(api.value().user_table_name == "users");
}
