#pragma once

namespace stackreg {

constexpr const char* STACK_PREFIX = "myapp";

constexpr const char* BOOTSTRAP_STACK = "myapp-bootstrap-stack";
constexpr const char* API_STACK = "myapp-api-stack";
constexpr const char* API_LAMBDA_STACK = "myapp-api-lambda-stack";
constexpr const char* ANALYTICS_LAMBDA_STACK = "myapp-analytics-lambda-stack";
constexpr const char* ANALYTICS_STACK = "myapp-analytics-stack";
constexpr const char* CLIENT_WEBSITE_STACK = "myapp-client-website-stack";

} // namespace stackreg
