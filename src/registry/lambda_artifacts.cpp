#include "stackreg/lambda_artifacts.hpp"
#include "stackreg/platform.hpp"
#include "stackreg/stack_names.hpp"

namespace stackreg {

const std::vector<LambdaArtifactDefinition>& lambda_artifact_definitions() {
    static const std::vector<LambdaArtifactDefinition> definitions = {
        {
            "apiLambda",
            API_LAMBDA_STACK,
            "API Lambda bundle",
            "apps/node-server/dist",
            "lambdas/api",
            "lambda.zip",
        },
        {
            "analyticsProcessor",
            ANALYTICS_LAMBDA_STACK,
            "Analytics processor Lambda bundle",
            "apps/analytics-lambda/dist",
            "lambdas/analytics",
            "analytics-processor-lambda.zip",
        },
    };
    return definitions;
}

Result<LambdaArtifactDefinition> get_lambda_artifact_definition(const std::string& id) {
    for (const auto& def : lambda_artifact_definitions()) {
        if (def.id == id) {
            return Result<LambdaArtifactDefinition>::ok(def);
        }
    }
    return Result<LambdaArtifactDefinition>::err(
        Error(ErrorCode::UNKNOWN_STACK, "Unknown Lambda artifact id: " + id));
}

const LambdaArtifactDefinition* find_lambda_artifact_for_stack(const std::string& stack_name) {
    for (const auto& def : lambda_artifact_definitions()) {
        if (def.stack_name == stack_name) return &def;
    }
    return nullptr;
}

std::string monorepo_root_for(const std::string& package_root) {
    return resolve_path(package_root, "../..");
}

std::string resolve_source_dist_path(const LambdaArtifactDefinition& def,
                                     const std::string& package_root) {
    return resolve_path(monorepo_root_for(package_root), def.source_dist);
}

std::string resolve_staging_directory(const LambdaArtifactDefinition& def,
                                      const std::string& package_root) {
    return resolve_path(join_path(package_root, "dist"), def.staging_subdir);
}

std::string resolve_zip_path(const LambdaArtifactDefinition& def,
                             const std::string& package_root) {
    return join_path(resolve_staging_directory(def, package_root), def.zip_file_name);
}

ArtifactRequirement build_artifact_requirement(const LambdaArtifactDefinition& def,
                                               const std::string& package_root) {
    return ArtifactRequirement{resolve_zip_path(def, package_root), def.description};
}

std::vector<ArtifactRequirement> list_artifact_requirements(const std::string& package_root) {
    std::vector<ArtifactRequirement> requirements;
    for (const auto& def : lambda_artifact_definitions()) {
        requirements.push_back(build_artifact_requirement(def, package_root));
    }
    return requirements;
}

} // namespace stackreg
