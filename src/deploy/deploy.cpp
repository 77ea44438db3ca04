#include "stackreg/deploy.hpp"
#include "stackreg/stage_expansion.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace stackreg {

DeploymentPlan plan_deployment(const StackRegistry& registry,
                               const SelectionSet& selection,
                               const UniversalProps& universal,
                               const std::string& artifact_base,
                               WarningCollector& warnings) {
    DeploymentPlan plan;

    if (selection.names) {
        for (const auto& name : *selection.names) {
            if (!registry.contains(name)) {
                if (warnings.get_effective_action(warning_to_string(Warning::selection_unmatched)) !=
                    WarningAction::Ignore) {
                    spdlog::warn("Selected stack \"{}\" is not registered", name);
                }
                warnings.emit(Warning::selection_unmatched, warnings::selection_unmatched(name));
                plan.unmatched_selection.push_back(name);
            }
        }
    }

    for (const auto& stack : registry) {
        if (!is_bootstrap_stack(stack.name) && !selection.matches(stack.name)) {
            spdlog::debug("Stack {} not selected", stack.name);
            plan.not_selected.push_back(stack.name);
            continue;
        }

        auto gate = gate_stack(stack, warnings, artifact_base);
        if (!gate.passed) {
            plan.skipped.push_back({stack.name, gate.missing});
            continue;
        }

        for (auto& instance : expand_stack(stack, universal, warnings)) {
            plan.instances.push_back(std::move(instance));
        }
    }

    return plan;
}

Result<void> instantiate_plan(const StackRegistry& registry,
                              const DeploymentPlan& plan,
                              SynthApp& app) {
    for (const auto& instance : plan.instances) {
        const StackDescriptor* stack = registry.find(instance.stack_name);
        if (stack == nullptr) {
            return Result<void>::err(
                Error(ErrorCode::UNKNOWN_STACK, "Unknown stack: " + instance.stack_name));
        }

        auto built = stack->constructor(app, instance.id, instance.props);
        if (built.isErr()) {
            Error error = built.error();
            error.withContext("stack " + instance.id);
            return Result<void>::err(error);
        }
    }
    return Result<void>::ok();
}

Result<DeploymentResult> run_deployment(const StackRegistry& registry,
                                        const DriverConfig& config,
                                        const std::vector<std::string>& args,
                                        WarningCollector& warnings) {
    if (config.region.empty()) {
        return Result<DeploymentResult>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  std::string(REGION_ENV) + " environment variable is not set"));
    }

    report_config_warnings(config, warnings);

    DeploymentResult result;
    auto selection = resolve_selection(config.stack_selection, args);
    result.plan = plan_deployment(registry, selection, UniversalProps{config.region},
                                  config.artifact_root, warnings);

    SynthApp app(config.output_dir);
    auto built = instantiate_plan(registry, result.plan, app);
    if (built.isErr()) {
        return Result<DeploymentResult>::err(built.error());
    }

    result.warnings = warnings.get_warnings();
    if (warnings.has_errors()) {
        std::set<std::string> escalated;
        for (const auto& w : result.warnings) {
            if (w.action == "error") escalated.insert(w.key);
        }
        std::string keys;
        for (const auto& key : escalated) {
            if (!keys.empty()) keys += ", ";
            keys += key;
        }
        return Result<DeploymentResult>::err(
            Error(ErrorCode::CONFIGURATION_ERROR, "warnings escalated to errors: " + keys));
    }

    auto written = app.synth();
    if (written.isErr()) {
        return Result<DeploymentResult>::err(written.error());
    }
    result.manifest_path = written.value();

    spdlog::info("Planned {} instance(s), skipped {} stack(s)",
                 result.plan.instances.size(), result.plan.skipped.size());
    return Result<DeploymentResult>::ok(std::move(result));
}

} // namespace stackreg
