#pragma once

/**
 * @file deploy.hpp
 * @brief Deployment driver: select, gate, expand, instantiate, synthesize
 *
 * Runs single-threaded. The plan is computed without side effects other
 * than logging and warnings; instantiation hands each planned instance to
 * its descriptor's constructor inside one SynthApp.
 */

#include "stackreg/artifact_gate.hpp"
#include "stackreg/config.hpp"
#include "stackreg/registry.hpp"
#include "stackreg/result.hpp"
#include "stackreg/selection.hpp"
#include "stackreg/synth.hpp"
#include "stackreg/warnings.hpp"

#include <string>
#include <vector>

namespace stackreg {

// ============================================================================
// Deployment Plan
// ============================================================================

struct SkippedStack {
    std::string name;
    std::vector<MissingArtifact> missing;
};

struct DeploymentPlan {
    std::vector<StackInstance> instances;         // registry order, stages in declared order
    std::vector<SkippedStack> skipped;            // failed the artifact gate
    std::vector<std::string> not_selected;        // filtered out by the selection
    std::vector<std::string> unmatched_selection; // selected names nobody registered
};

/**
 * @brief Compute the instances of one run
 *
 * Bootstrap stacks bypass the selection. Every eligible stack goes through
 * the artifact gate (requirements resolve against artifact_base) and then
 * stage expansion.
 */
DeploymentPlan plan_deployment(const StackRegistry& registry,
                               const SelectionSet& selection,
                               const UniversalProps& universal,
                               const std::string& artifact_base,
                               WarningCollector& warnings);

// Run each planned instance's constructor inside the scope
Result<void> instantiate_plan(const StackRegistry& registry,
                              const DeploymentPlan& plan,
                              SynthApp& app);

// ============================================================================
// Deployment Run
// ============================================================================

struct DeploymentResult {
    DeploymentPlan plan;
    std::string manifest_path;
    std::vector<WarningObject> warnings;
};

/**
 * @brief Full driver run
 *
 * Resolves the selection from config.stack_selection, falling back to args,
 * plans, instantiates and writes the manifest into config.output_dir.
 *
 * Fails with CONFIGURATION_ERROR when the region is empty or when a warning
 * is escalated to an error by the policy; constructor and synthesis
 * failures are passed through.
 */
Result<DeploymentResult> run_deployment(const StackRegistry& registry,
                                        const DriverConfig& config,
                                        const std::vector<std::string>& args,
                                        WarningCollector& warnings);

} // namespace stackreg
