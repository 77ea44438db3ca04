#include "stackreg/catalog.hpp"
#include "stackreg/lambda_artifacts.hpp"
#include "stackreg/synth.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace stackreg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<SchemaField> string_fields(std::initializer_list<const char*> names) {
    std::vector<SchemaField> fields;
    for (const char* name : names) {
        fields.push_back({name, OutputSchema::string()});
    }
    return fields;
}

// Constructor that records the instance in the scope under the given kind
StackConstructor record_as(const std::string& kind) {
    return [kind](SynthApp& scope, const std::string& id, const StackProps& props) {
        if (!scope.add_stack({id, kind, props})) {
            return Result<void>::err(
                Error(ErrorCode::INVALID_REGISTRY, "stack id already defined: " + id));
        }
        return Result<void>::ok();
    };
}

Result<void> construct_client_website(SynthApp& scope,
                                      const std::string& id,
                                      const StackProps& props) {
    auto domains = normalize_domain_config(props);
    if (domains.isErr()) {
        return Result<void>::err(domains.error());
    }
    StackProps resolved = props;
    resolved["domainNames"] = domains.value().domain_names;
    resolved["hostedZoneId"] = domains.value().hosted_zone_id;
    if (!scope.add_stack({id, "client-website", resolved})) {
        return Result<void>::err(
            Error(ErrorCode::INVALID_REGISTRY, "stack id already defined: " + id));
    }
    return Result<void>::ok();
}

} // namespace

// ============================================================================
// Output Schemas
// ============================================================================

OutputSchema api_stack_output_schema() {
    return namespaced_schema(API_STACK, string_fields({
        "userTableName",
        "verificationTableName",
        "rateLimitTableName",
        "denyListTableName",
    }));
}

OutputSchema api_lambda_stack_output_schema() {
    return OutputSchema::object({{"apiLambdaFunctionUrl", OutputSchema::url()}});
}

OutputSchema analytics_lambda_stack_output_schema() {
    return namespaced_schema(ANALYTICS_LAMBDA_STACK, string_fields({
        "analyticsProcessorLambdaFunctionArn",
        "analyticsProcessorLambdaFunctionName",
        "analyticsProcessorRuleArn",
        "analyticsProcessorRuleName",
    }));
}

OutputSchema analytics_stack_output_schema() {
    return namespaced_schema(ANALYTICS_STACK, string_fields({
        "eventBusArn",
        "eventBusName",
        "deadLetterQueueArn",
        "deadLetterQueueUrl",
        "dedupeTableName",
        "aggregateTableName",
        "eventLogGroupName",
        "processorLogGroupName",
    }));
}

OutputSchema client_website_stack_output_schema() {
    auto fields = string_fields({
        "clientWebsiteBucketName",
        "clientWebsiteDistributionId",
        "clientWebsiteDistributionDomainName",
        "clientWebsiteDistributionHostedZoneId",
        "clientWebsiteCertificateArn",
        "clientWebsiteDomainName",
    });
    fields.push_back({"clientWebsiteAlternateDomainNames",
                      OutputSchema::array(OutputSchema::string())});
    return namespaced_schema(CLIENT_WEBSITE_STACK, std::move(fields));
}

// ============================================================================
// Typed Outputs
// ============================================================================

void from_json(const nlohmann::json& j, ApiStackOutputs& out) {
    j.at("userTableName").get_to(out.user_table_name);
    j.at("verificationTableName").get_to(out.verification_table_name);
    j.at("rateLimitTableName").get_to(out.rate_limit_table_name);
    j.at("denyListTableName").get_to(out.deny_list_table_name);
}

void from_json(const nlohmann::json& j, ApiLambdaStackOutputs& out) {
    j.at("apiLambdaFunctionUrl").get_to(out.function_url);
}

void from_json(const nlohmann::json& j, AnalyticsLambdaStackOutputs& out) {
    j.at("analyticsProcessorLambdaFunctionArn").get_to(out.function_arn);
    j.at("analyticsProcessorLambdaFunctionName").get_to(out.function_name);
    j.at("analyticsProcessorRuleArn").get_to(out.rule_arn);
    j.at("analyticsProcessorRuleName").get_to(out.rule_name);
}

void from_json(const nlohmann::json& j, AnalyticsStackOutputs& out) {
    j.at("eventBusArn").get_to(out.event_bus_arn);
    j.at("eventBusName").get_to(out.event_bus_name);
    j.at("deadLetterQueueArn").get_to(out.dead_letter_queue_arn);
    j.at("deadLetterQueueUrl").get_to(out.dead_letter_queue_url);
    j.at("dedupeTableName").get_to(out.dedupe_table_name);
    j.at("aggregateTableName").get_to(out.aggregate_table_name);
    j.at("eventLogGroupName").get_to(out.event_log_group_name);
    j.at("processorLogGroupName").get_to(out.processor_log_group_name);
}

void from_json(const nlohmann::json& j, ClientWebsiteStackOutputs& out) {
    j.at("clientWebsiteBucketName").get_to(out.bucket_name);
    j.at("clientWebsiteDistributionId").get_to(out.distribution_id);
    j.at("clientWebsiteDistributionDomainName").get_to(out.distribution_domain_name);
    j.at("clientWebsiteDistributionHostedZoneId").get_to(out.distribution_hosted_zone_id);
    j.at("clientWebsiteCertificateArn").get_to(out.certificate_arn);
    j.at("clientWebsiteDomainName").get_to(out.domain_name);
    j.at("clientWebsiteAlternateDomainNames").get_to(out.alternate_domain_names);
}

// ============================================================================
// Client Website
// ============================================================================

StackProps client_website_props_from_env(const EnvLookup& env) {
    auto lookup = [&env](const char* name) -> std::string {
        if (!env) return "";
        return env(name).value_or("");
    };

    std::vector<std::string> alternates;
    std::string raw = lookup(CLIENT_WEBSITE_ALTERNATE_DOMAINS_ENV);
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) comma = raw.size();
        std::string entry = trim(raw.substr(start, comma - start));
        if (!entry.empty()) alternates.push_back(entry);
        start = comma + 1;
    }

    return StackProps{
        {"domainName", lookup(CLIENT_WEBSITE_DOMAIN_ENV)},
        {"hostedZoneId", lookup(CLIENT_WEBSITE_HOSTED_ZONE_ENV)},
        {"alternateDomainNames", alternates},
    };
}

Result<DomainConfig> normalize_domain_config(const StackProps& props) {
    auto get = [&props](const char* key) -> std::string {
        if (props.contains(key) && props[key].is_string()) {
            return trim(props[key].get<std::string>());
        }
        return "";
    };

    std::string domain = get("domainName");
    if (domain.empty()) {
        return Result<DomainConfig>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  std::string(CLIENT_WEBSITE_DOMAIN_ENV) +
                      " is required to deploy the client website stack"));
    }

    std::string zone = get("hostedZoneId");
    if (zone.empty()) {
        return Result<DomainConfig>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  std::string(CLIENT_WEBSITE_HOSTED_ZONE_ENV) +
                      " is required to deploy the client website stack"));
    }

    DomainConfig config;
    config.hosted_zone_id = zone;
    config.domain_names.push_back(domain);
    if (props.contains("alternateDomainNames") && props["alternateDomainNames"].is_array()) {
        for (const auto& entry : props["alternateDomainNames"]) {
            if (!entry.is_string()) continue;
            std::string name = trim(entry.get<std::string>());
            if (name.empty()) continue;
            if (std::find(config.domain_names.begin(), config.domain_names.end(), name) ==
                config.domain_names.end()) {
                config.domain_names.push_back(name);
            }
        }
    }
    return Result<DomainConfig>::ok(std::move(config));
}

// ============================================================================
// Default Catalog
// ============================================================================

std::vector<StackDescriptor> build_default_catalog(const EnvLookup& env,
                                                   const std::string& package_root) {
    std::vector<StackDescriptor> catalog;

    StackDescriptor bootstrap;
    bootstrap.name = BOOTSTRAP_STACK;
    bootstrap.description = "Bootstrap stack for CdkTF projects";
    bootstrap.constructor = record_as("bootstrap");
    bootstrap.props = {{"migrateStateToBootstrappedBackend", true}};
    catalog.push_back(std::move(bootstrap));

    StackDescriptor api;
    api.name = API_STACK;
    api.description = "API stack for the application";
    api.constructor = record_as("api");
    api.output_schema = api_stack_output_schema();
    catalog.push_back(std::move(api));

    StackDescriptor api_lambda;
    api_lambda.name = API_LAMBDA_STACK;
    api_lambda.description = "Lambdas for API stack";
    api_lambda.constructor = record_as("api-lambda");
    api_lambda.output_schema = api_lambda_stack_output_schema();
    api_lambda.output_envelope = OutputEnvelope::Flat;
    if (const auto* def = find_lambda_artifact_for_stack(API_LAMBDA_STACK)) {
        api_lambda.required_artifacts =
            std::vector<ArtifactRequirement>{build_artifact_requirement(*def, package_root)};
    }
    catalog.push_back(std::move(api_lambda));

    StackDescriptor analytics_lambda;
    analytics_lambda.name = ANALYTICS_LAMBDA_STACK;
    analytics_lambda.description = "Analytics processor lambda stack";
    analytics_lambda.constructor = record_as("analytics-lambda");
    analytics_lambda.output_schema = analytics_lambda_stack_output_schema();
    if (const auto* def = find_lambda_artifact_for_stack(ANALYTICS_LAMBDA_STACK)) {
        analytics_lambda.required_artifacts =
            std::vector<ArtifactRequirement>{build_artifact_requirement(*def, package_root)};
    }
    catalog.push_back(std::move(analytics_lambda));

    StackDescriptor analytics;
    analytics.name = ANALYTICS_STACK;
    analytics.description = "Analytics pipeline for DAU/MAU tracking";
    analytics.constructor = record_as("analytics");
    analytics.output_schema = analytics_stack_output_schema();
    catalog.push_back(std::move(analytics));

    StackDescriptor website;
    website.name = CLIENT_WEBSITE_STACK;
    website.description = "Static hosting for the client website";
    website.constructor = construct_client_website;
    website.props = client_website_props_from_env(env);
    website.output_schema = client_website_stack_output_schema();
    catalog.push_back(std::move(website));

    return catalog;
}

} // namespace stackreg
