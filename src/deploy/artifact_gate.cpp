#include "stackreg/artifact_gate.hpp"
#include "stackreg/platform.hpp"

#include <spdlog/spdlog.h>

namespace stackreg {

ArtifactGateResult check_artifacts(const std::vector<ArtifactRequirement>& requirements,
                                   const std::string& base_dir) {
    ArtifactGateResult result;
    for (const auto& req : requirements) {
        std::string resolved = resolve_path(base_dir, req.path);
        if (!path_exists(resolved)) {
            result.missing.push_back({req, resolved});
        }
    }
    result.passed = result.missing.empty();
    return result;
}

ArtifactGateResult gate_stack(const StackDescriptor& stack,
                              WarningCollector& warnings,
                              const std::string& base_dir) {
    if (!stack.required_artifacts || stack.required_artifacts->empty()) {
        return ArtifactGateResult{};
    }

    auto result = check_artifacts(*stack.required_artifacts, base_dir);
    if (result.passed) {
        return result;
    }

    bool report = warnings.get_effective_action(warning_to_string(Warning::artifact_missing)) !=
                  WarningAction::Ignore;
    if (report) {
        spdlog::warn("Skipping stack \"{}\" because required artifacts were not found:", stack.name);
    }
    for (const auto& m : result.missing) {
        if (report) {
            spdlog::warn("  - {} ({})", m.requirement.description, m.requirement.path);
        }
        warnings.emit(Warning::artifact_missing,
                      warnings::artifact_missing(stack.name, m.requirement.path,
                                                 m.requirement.description));
    }
    return result;
}

} // namespace stackreg
