#pragma once

/**
 * @file catalog.hpp
 * @brief The platform's stack catalog and the typed shape of its outputs
 *
 * build_default_catalog() returns the descriptors in deployment order:
 * bootstrap, api, api lambda, analytics lambda, analytics, client website.
 */

#include "stackreg/platform.hpp"
#include "stackreg/result.hpp"
#include "stackreg/stack_names.hpp"
#include "stackreg/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stackreg {

// ============================================================================
// Output Schemas
// ============================================================================

OutputSchema api_stack_output_schema();
OutputSchema api_lambda_stack_output_schema();   // flat envelope
OutputSchema analytics_lambda_stack_output_schema();
OutputSchema analytics_stack_output_schema();
OutputSchema client_website_stack_output_schema();

// ============================================================================
// Typed Outputs
// ============================================================================

struct ApiStackOutputs {
    std::string user_table_name;
    std::string verification_table_name;
    std::string rate_limit_table_name;
    std::string deny_list_table_name;
};

struct ApiLambdaStackOutputs {
    std::string function_url;
};

struct AnalyticsLambdaStackOutputs {
    std::string function_arn;
    std::string function_name;
    std::string rule_arn;
    std::string rule_name;
};

struct AnalyticsStackOutputs {
    std::string event_bus_arn;
    std::string event_bus_name;
    std::string dead_letter_queue_arn;
    std::string dead_letter_queue_url;
    std::string dedupe_table_name;
    std::string aggregate_table_name;
    std::string event_log_group_name;
    std::string processor_log_group_name;
};

struct ClientWebsiteStackOutputs {
    std::string bucket_name;
    std::string distribution_id;
    std::string distribution_domain_name;
    std::string distribution_hosted_zone_id;
    std::string certificate_arn;
    std::string domain_name;
    std::vector<std::string> alternate_domain_names;
};

void from_json(const nlohmann::json& j, ApiStackOutputs& out);
void from_json(const nlohmann::json& j, ApiLambdaStackOutputs& out);
void from_json(const nlohmann::json& j, AnalyticsLambdaStackOutputs& out);
void from_json(const nlohmann::json& j, AnalyticsStackOutputs& out);
void from_json(const nlohmann::json& j, ClientWebsiteStackOutputs& out);

// ============================================================================
// Client Website
// ============================================================================

constexpr const char* CLIENT_WEBSITE_DOMAIN_ENV = "CLIENT_WEBSITE_DOMAIN_NAME";
constexpr const char* CLIENT_WEBSITE_HOSTED_ZONE_ENV = "CLIENT_WEBSITE_HOSTED_ZONE_ID";
constexpr const char* CLIENT_WEBSITE_ALTERNATE_DOMAINS_ENV = "CLIENT_WEBSITE_ALTERNATE_DOMAINS";

// { domainName, hostedZoneId, alternateDomainNames } from the environment;
// missing values become empty strings and an empty list
StackProps client_website_props_from_env(const EnvLookup& env);

struct DomainConfig {
    std::vector<std::string> domain_names;  // primary first, trimmed, unique
    std::string hosted_zone_id;
};

// CONFIGURATION_ERROR when the domain name or hosted zone id is blank
Result<DomainConfig> normalize_domain_config(const StackProps& props);

// ============================================================================
// Default Catalog
// ============================================================================

/**
 * @brief Descriptors of the platform deployment
 *
 * @param env          source of the client website settings
 * @param package_root root for Lambda bundle requirements
 */
std::vector<StackDescriptor> build_default_catalog(const EnvLookup& env,
                                                   const std::string& package_root);

} // namespace stackreg
