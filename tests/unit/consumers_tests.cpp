#include <doctest/doctest.h>
#include <stackreg/consumers.hpp>

#include "../test_helpers.hpp"

using namespace stackreg;
using stackreg::testing::TempTestDir;
using stackreg::testing::fixed_env;
using stackreg::testing::write_file;

namespace {

std::shared_ptr<const StackRegistry> platform_registry() {
    return std::make_shared<const StackRegistry>(
        StackRegistry::create(build_default_catalog(fixed_env({}), "/pkg")).value());
}

void write_api_outputs(const std::string& base) {
    write_file(resolve_output_path(API_STACK, base), nlohmann::json{{API_STACK, {
        {"userTableName", "users"},
        {"verificationTableName", "verification"},
        {"rateLimitTableName", "rate-limit"},
        {"denyListTableName", "deny-list"},
    }}}.dump());
}

void write_analytics_outputs(const std::string& base) {
    write_file(resolve_output_path(ANALYTICS_STACK, base), nlohmann::json{{ANALYTICS_STACK, {
        {"eventBusArn", "arn:aws:events:us-east-1:1:event-bus/analytics"},
        {"eventBusName", "analytics"},
        {"deadLetterQueueArn", "arn:aws:sqs:us-east-1:1:analytics-dlq"},
        {"deadLetterQueueUrl", "https://sqs.us-east-1.amazonaws.com/1/analytics-dlq"},
        {"dedupeTableName", "analytics-dedupe"},
        {"aggregateTableName", "analytics-aggregate"},
        {"eventLogGroupName", "/aws/events/analytics"},
        {"processorLogGroupName", "/aws/lambda/analytics-processor"},
    }}}.dump());
}

} // namespace

TEST_CASE("service outputs combine the api and analytics stacks") {
    TempTestDir dir;
    write_api_outputs(dir.path);
    write_analytics_outputs(dir.path);

    OutputLoader loader(platform_registry(), dir.path);
    auto outputs = resolve_service_outputs(loader);
    REQUIRE(outputs.isOk());
    CHECK(outputs.value().user_table_name == "users");
    CHECK(outputs.value().deny_list_table_name == "deny-list");
    CHECK(outputs.value().event_bus_name == "analytics");
    CHECK(outputs.value().dead_letter_queue_url == "https://sqs.us-east-1.amazonaws.com/1/analytics-dlq");
    CHECK(outputs.value().analytics_dedupe_table_name == "analytics-dedupe");
    CHECK(outputs.value().analytics_aggregate_table_name == "analytics-aggregate");
    CHECK(loader.cached_count() == 2);
}

TEST_CASE("the first missing stack fails service resolution") {
    TempTestDir dir;
    write_api_outputs(dir.path);

    OutputLoader loader(platform_registry(), dir.path);
    auto outputs = resolve_service_outputs(loader);
    REQUIRE(outputs.isErr());
    CHECK(outputs.error().code() == ErrorCode::MISSING_OUTPUT);
    CHECK(outputs.error().message().find(ANALYTICS_STACK) != std::string::npos);
}

TEST_CASE("bundled services read outputs from the working directory") {
    CHECK(service_outputs_base(true) == std::optional<std::string>("."));
    CHECK_FALSE(service_outputs_base(false).has_value());
}
