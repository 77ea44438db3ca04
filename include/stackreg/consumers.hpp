#pragma once

#include "stackreg/catalog.hpp"
#include "stackreg/output_loader.hpp"
#include "stackreg/result.hpp"

#include <optional>
#include <string>

namespace stackreg {

// Base path used by bundled services, whose outputs ship beside the binary
constexpr const char* BUNDLED_OUTPUTS_BASE = ".";

// Outputs base for a service: "." when bundled, the loader default otherwise
inline std::optional<std::string> service_outputs_base(bool bundled) {
    if (bundled) return std::string(BUNDLED_OUTPUTS_BASE);
    return std::nullopt;
}

// ============================================================================
// Service Outputs
// ============================================================================

/**
 * Identifiers the backend services read at start-up: security tables from
 * the API stack, event bus, dead letter queue and analytics tables from the
 * analytics stack.
 */
struct ServiceOutputs {
    std::string user_table_name;
    std::string verification_table_name;
    std::string rate_limit_table_name;
    std::string deny_list_table_name;

    std::string event_bus_name;
    std::string dead_letter_queue_url;
    std::string analytics_dedupe_table_name;
    std::string analytics_aggregate_table_name;
};

// First failure wins; later stacks are not read
Result<ServiceOutputs> resolve_service_outputs(OutputLoader& loader,
                                               const std::optional<std::string>& base_path = std::nullopt);

} // namespace stackreg
