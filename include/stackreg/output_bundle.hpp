#pragma once

/**
 * @file output_bundle.hpp
 * @brief Ship deployed stack outputs inside a service's build output
 *
 * Services that run from their dist directory read outputs with the
 * bundled base path ".", so the deployed tree
 *   <outputs root>/stacks/<stack-name>/outputs.json
 * is copied to
 *   <dist>/cdktf-outputs/stacks/<stack-name>/outputs.json
 */

#include "stackreg/result.hpp"

#include <string>
#include <vector>

namespace stackreg {

constexpr const char* OUTPUTS_ROOT = "cdktf-outputs";
constexpr const char* DIST_DIR = "dist";

struct BundleOutputsResult {
    bool source_found = false;
    std::string source_root;
    std::string dest_root;              // <dist>/cdktf-outputs
    std::vector<std::string> copied;    // paths relative to dest_root, sorted
};

/**
 * @brief Copy every outputs.json under source_root into <dist_dir>/cdktf-outputs
 *
 * A missing source_root is not an error: nothing has been deployed yet, so
 * the result has source_found unset and nothing is copied. A missing
 * dist_dir means the service was not built and yields IO_ERROR, as does
 * any failed copy. Other files in the tree are left out.
 */
Result<BundleOutputsResult> bundle_outputs(const std::string& source_root,
                                           const std::string& dist_dir);

} // namespace stackreg
