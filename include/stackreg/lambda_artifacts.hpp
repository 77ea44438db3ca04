#pragma once

#include "stackreg/result.hpp"
#include "stackreg/types.hpp"

#include <string>
#include <vector>

namespace stackreg {

// ============================================================================
// Lambda Artifact Definitions
// ============================================================================

/**
 * A Lambda bundle that must be staged before its stack can deploy.
 *
 * The build copies <monorepo>/<source_dist> into
 * <package_root>/dist/<staging_subdir> and zips it as zip_file_name.
 */
struct LambdaArtifactDefinition {
    std::string id;
    std::string stack_name;
    std::string description;
    std::string source_dist;      // relative to the monorepo root
    std::string staging_subdir;   // relative to <package_root>/dist
    std::string zip_file_name;
};

// Every known bundle, in deployment order
const std::vector<LambdaArtifactDefinition>& lambda_artifact_definitions();

// Definition by id; UNKNOWN_STACK for an unknown id
Result<LambdaArtifactDefinition> get_lambda_artifact_definition(const std::string& id);

// Definition owned by a stack, nullptr when the stack has none
const LambdaArtifactDefinition* find_lambda_artifact_for_stack(const std::string& stack_name);

// The monorepo root is two levels above the package root
std::string monorepo_root_for(const std::string& package_root);

std::string resolve_source_dist_path(const LambdaArtifactDefinition& def,
                                     const std::string& package_root);
std::string resolve_staging_directory(const LambdaArtifactDefinition& def,
                                      const std::string& package_root);
std::string resolve_zip_path(const LambdaArtifactDefinition& def,
                             const std::string& package_root);

// Requirement on the bundle's zip file
ArtifactRequirement build_artifact_requirement(const LambdaArtifactDefinition& def,
                                               const std::string& package_root);

std::vector<ArtifactRequirement> list_artifact_requirements(const std::string& package_root);

} // namespace stackreg
