#pragma once

#include "stackreg/types.hpp"
#include "stackreg/warnings.hpp"

#include <string>
#include <vector>

namespace stackreg {

// ============================================================================
// Artifact Gate
// ============================================================================

struct MissingArtifact {
    ArtifactRequirement requirement;
    std::string resolved_path;
};

struct ArtifactGateResult {
    bool passed = true;
    std::vector<MissingArtifact> missing;  // every absent requirement, in declaration order
};

// Check requirements without reporting. Relative paths resolve against
// base_dir, or the working directory when base_dir is empty.
ArtifactGateResult check_artifacts(const std::vector<ArtifactRequirement>& requirements,
                                   const std::string& base_dir = "");

// Gate one stack: a stack without requirements passes. A failing stack is
// logged and one artifact_missing warning per absent requirement is emitted.
ArtifactGateResult gate_stack(const StackDescriptor& stack,
                              WarningCollector& warnings,
                              const std::string& base_dir = "");

} // namespace stackreg
