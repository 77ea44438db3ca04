#pragma once

#include "stackreg/platform.hpp"
#include "stackreg/result.hpp"
#include "stackreg/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stackreg {

constexpr const char* REGION_ENV = "AWS_REGION";
constexpr const char* PACKAGE_ROOT_ENV = "STACKREG_PACKAGE_ROOT";
constexpr const char* CONFIG_FILE_SCHEMA = "stackreg.config.v1";

// ============================================================================
// Config File
// ============================================================================

struct ConfigFile {
    std::string schema;
    std::string source_path;

    // Relative paths are kept as written; load_driver_config resolves them
    // against the directory holding the file
    std::optional<std::string> region;
    std::optional<std::string> package_root;
    std::optional<std::string> artifact_root;
    std::optional<std::string> output_dir;

    WarningPolicy warnings;
};

struct ConfigFileParseResult {
    bool ok = false;
    std::string error;
    ConfigFile config;
    std::vector<std::string> warnings;  // "invalid_configuration:<reason>"
};

// Parse a stackreg.config.v1 document
ConfigFileParseResult parse_config_file(const std::string& json_str,
                                        const std::string& source_path = "");

// ============================================================================
// Driver Config
// ============================================================================

struct DriverConfig {
    std::string region;                          // empty only when not required
    std::string package_root;                    // absolute
    std::string artifact_root;                   // base for artifact requirements; empty is the working directory
    std::string output_dir;                      // synthesis output directory
    std::optional<std::string> stack_selection;  // raw STACK value
    WarningPolicy warnings;
    std::vector<std::string> config_warnings;    // reasons from the config file
    std::string config_path;                     // empty when no file was read
};

struct ConfigSources {
    EnvLookup env;
    std::optional<std::string> config_path;   // --config
    std::optional<std::string> package_root;  // --package-root
    bool require_region = true;
};

/**
 * @brief Resolve the driver configuration
 *
 * Precedence, highest first:
 * - region: AWS_REGION, then the config file
 * - package root: explicit override, STACKREG_PACKAGE_ROOT, the config
 *   file, then the working directory
 * - artifact root: config file, else empty (the working directory)
 * - output dir: config file, then <package root>/cdktf.out
 *
 * A missing region when require_region is set, an unreadable config file
 * or a malformed one yields CONFIGURATION_ERROR.
 */
Result<DriverConfig> load_driver_config(const ConfigSources& sources);

// Emit each config file reason as an invalid_configuration warning
void report_config_warnings(const DriverConfig& config, WarningCollector& warnings);

} // namespace stackreg
