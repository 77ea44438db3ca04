#include "stackreg/consumers.hpp"

namespace stackreg {

Result<ServiceOutputs> resolve_service_outputs(OutputLoader& loader,
                                               const std::optional<std::string>& base_path) {
    auto api = loader.load_as<ApiStackOutputs>(API_STACK, base_path);
    if (api.isErr()) {
        return Result<ServiceOutputs>::err(api.error());
    }

    auto analytics = loader.load_as<AnalyticsStackOutputs>(ANALYTICS_STACK, base_path);
    if (analytics.isErr()) {
        return Result<ServiceOutputs>::err(analytics.error());
    }

    ServiceOutputs out;
    out.user_table_name = api.value().user_table_name;
    out.verification_table_name = api.value().verification_table_name;
    out.rate_limit_table_name = api.value().rate_limit_table_name;
    out.deny_list_table_name = api.value().deny_list_table_name;

    out.event_bus_name = analytics.value().event_bus_name;
    out.dead_letter_queue_url = analytics.value().dead_letter_queue_url;
    out.analytics_dedupe_table_name = analytics.value().dedupe_table_name;
    out.analytics_aggregate_table_name = analytics.value().aggregate_table_name;
    return Result<ServiceOutputs>::ok(std::move(out));
}

} // namespace stackreg
