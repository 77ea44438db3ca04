#include <doctest/doctest.h>
#include <stackreg/catalog.hpp>
#include <stackreg/lambda_artifacts.hpp>
#include <stackreg/registry.hpp>

#include "../test_helpers.hpp"

using namespace stackreg;
using stackreg::testing::fixed_env;

namespace {

EnvLookup website_env() {
    return fixed_env({
        {"CLIENT_WEBSITE_DOMAIN_NAME", "example.com"},
        {"CLIENT_WEBSITE_HOSTED_ZONE_ID", "Z123"},
        {"CLIENT_WEBSITE_ALTERNATE_DOMAINS", " www.example.com, ,example.com,app.example.com "},
    });
}

} // namespace

TEST_CASE("default catalog lists the platform stacks in deployment order") {
    auto registry = StackRegistry::create(build_default_catalog(website_env(), "/pkg"));
    REQUIRE(registry.isOk());
    CHECK(registry.value().names() == std::vector<std::string>{
        BOOTSTRAP_STACK, API_STACK, API_LAMBDA_STACK,
        ANALYTICS_LAMBDA_STACK, ANALYTICS_STACK, CLIENT_WEBSITE_STACK});
}

TEST_CASE("Lambda stacks require their bundles") {
    auto catalog = build_default_catalog(website_env(), "/pkg");
    const auto& api_lambda = catalog[2];
    REQUIRE(api_lambda.required_artifacts.has_value());
    REQUIRE(api_lambda.required_artifacts->size() == 1);
    CHECK((*api_lambda.required_artifacts)[0].path == "/pkg/dist/lambdas/api/lambda.zip");
    CHECK(api_lambda.output_envelope == OutputEnvelope::Flat);

    const auto& analytics_lambda = catalog[3];
    REQUIRE(analytics_lambda.required_artifacts.has_value());
    CHECK((*analytics_lambda.required_artifacts)[0].description == "Analytics processor Lambda bundle");

    CHECK_FALSE(catalog[1].required_artifacts.has_value());
}

TEST_CASE("bootstrap props migrate state to the bootstrapped backend") {
    auto catalog = build_default_catalog(website_env(), "/pkg");
    CHECK(catalog[0].props == StackProps{{"migrateStateToBootstrappedBackend", true}});
}

TEST_CASE("client website props come from the environment") {
    auto props = client_website_props_from_env(website_env());
    CHECK(props["domainName"] == "example.com");
    CHECK(props["hostedZoneId"] == "Z123");
    CHECK(props["alternateDomainNames"] ==
          nlohmann::json::array({"www.example.com", "example.com", "app.example.com"}));

    auto empty = client_website_props_from_env(fixed_env({}));
    CHECK(empty["domainName"] == "");
    CHECK(empty["alternateDomainNames"].empty());
}

TEST_CASE("normalize_domain_config dedupes and validates") {
    auto config = normalize_domain_config(client_website_props_from_env(website_env()));
    REQUIRE(config.isOk());
    CHECK(config.value().domain_names ==
          std::vector<std::string>{"example.com", "www.example.com", "app.example.com"});
    CHECK(config.value().hosted_zone_id == "Z123");

    auto no_domain = normalize_domain_config(client_website_props_from_env(fixed_env({})));
    REQUIRE(no_domain.isErr());
    CHECK(no_domain.error().code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(no_domain.error().message().find("CLIENT_WEBSITE_DOMAIN_NAME") != std::string::npos);

    auto no_zone = normalize_domain_config({{"domainName", "example.com"}, {"hostedZoneId", " "}});
    REQUIRE(no_zone.isErr());
    CHECK(no_zone.error().message().find("CLIENT_WEBSITE_HOSTED_ZONE_ID") != std::string::npos);
}

TEST_CASE("catalog constructors record into the synthesis scope") {
    auto catalog = build_default_catalog(website_env(), "/pkg");
    SynthApp app("unused");

    REQUIRE(catalog[1].constructor(app, "myapp-api-stack", {{"region", "us-east-1"}}).isOk());
    REQUIRE(catalog[5].constructor(app, "myapp-client-website-stack", catalog[5].props).isOk());

    REQUIRE(app.stacks().size() == 2);
    CHECK(app.stacks()[0].kind == "api");
    CHECK(app.stacks()[1].kind == "client-website");
    CHECK(app.stacks()[1].props["domainNames"].size() == 3);

    auto repeated = catalog[1].constructor(app, "myapp-api-stack", StackProps::object());
    CHECK(repeated.isErr());
}

TEST_CASE("client website constructor fails without a domain") {
    auto catalog = build_default_catalog(fixed_env({}), "/pkg");
    SynthApp app("unused");
    auto built = catalog[5].constructor(app, "myapp-client-website-stack", catalog[5].props);
    REQUIRE(built.isErr());
    CHECK(built.error().code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("output schemas accept deployed documents") {
    nlohmann::json api = {{API_STACK, {
        {"userTableName", "users"},
        {"verificationTableName", "verification"},
        {"rateLimitTableName", "rate-limit"},
        {"denyListTableName", "deny-list"},
    }}};
    CHECK(api_stack_output_schema().validate(api).ok);

    nlohmann::json lambda = {{"apiLambdaFunctionUrl", "https://xyz.lambda-url.us-east-1.on.aws/"}};
    CHECK(api_lambda_stack_output_schema().validate(lambda).ok);

    nlohmann::json website = {{CLIENT_WEBSITE_STACK, {
        {"clientWebsiteBucketName", "bucket"},
        {"clientWebsiteDistributionId", "E1"},
        {"clientWebsiteDistributionDomainName", "d1.cloudfront.net"},
        {"clientWebsiteDistributionHostedZoneId", "Z2FDTNDATAQYW2"},
        {"clientWebsiteCertificateArn", "arn:aws:acm:us-east-1:1:certificate/x"},
        {"clientWebsiteDomainName", "example.com"},
        {"clientWebsiteAlternateDomainNames", {"www.example.com"}},
    }}};
    auto report = client_website_stack_output_schema().validate(website);
    REQUIRE(report.ok);

    auto typed = report.value[CLIENT_WEBSITE_STACK].get<ClientWebsiteStackOutputs>();
    CHECK(typed.bucket_name == "bucket");
    CHECK(typed.alternate_domain_names == std::vector<std::string>{"www.example.com"});
}
