#include "stackreg/config.hpp"
#include "stackreg/selection.hpp"
#include "stackreg/synth.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace stackreg {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Non-blank, trimmed environment value
std::optional<std::string> env_value(const EnvLookup& env, const char* name) {
    if (!env) return std::nullopt;
    auto value = env(name);
    if (!value) return std::nullopt;
    std::string trimmed = trim(*value);
    if (trimmed.empty()) return std::nullopt;
    return trimmed;
}

} // namespace

ConfigFileParseResult parse_config_file(const std::string& json_str,
                                        const std::string& source_path) {
    ConfigFileParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_FILE_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_FILE_SCHEMA;
            return result;
        }

        const char* path_keys[] = {"region", "package_root", "artifact_root", "output_dir"};
        std::optional<std::string>* targets[] = {
            &result.config.region,
            &result.config.package_root,
            &result.config.artifact_root,
            &result.config.output_dir,
        };
        for (size_t i = 0; i < 4; ++i) {
            const char* key = path_keys[i];
            if (!j.contains(key)) continue;
            auto value = get_string(j, key);
            if (value && !trim(*value).empty()) {
                *targets[i] = trim(*value);
            } else {
                result.warnings.push_back(std::string("invalid_configuration:invalid_") + key);
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }
                std::optional<WarningAction> action;
                if (val.is_string()) {
                    action = parse_warning_action(val.get<std::string>());
                }
                if (action) {
                    result.config.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        } else if (j.contains("warnings")) {
            result.warnings.push_back("invalid_configuration:invalid_warnings");
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<DriverConfig> load_driver_config(const ConfigSources& sources) {
    DriverConfig config;
    ConfigFile file;
    std::string file_dir;

    if (sources.config_path) {
        config.config_path = resolve_path("", *sources.config_path);
        auto content = read_file(config.config_path);
        if (!content) {
            return Result<DriverConfig>::err(
                Error(ErrorCode::CONFIGURATION_ERROR,
                      "failed to read config file: " + config.config_path));
        }
        auto parsed = parse_config_file(*content, config.config_path);
        if (!parsed.ok) {
            return Result<DriverConfig>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, parsed.error).withContext(config.config_path));
        }
        file = std::move(parsed.config);
        file_dir = get_parent_directory(config.config_path);
        for (const auto& w : parsed.warnings) {
            // strip the "invalid_configuration:" key prefix
            auto colon = w.find(':');
            config.config_warnings.push_back(colon == std::string::npos ? w : w.substr(colon + 1));
        }
        spdlog::debug("Loaded config file {}", config.config_path);
    }

    // Region
    if (auto region = env_value(sources.env, REGION_ENV)) {
        config.region = *region;
    } else if (file.region) {
        config.region = *file.region;
    } else if (sources.require_region) {
        return Result<DriverConfig>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  std::string(REGION_ENV) + " environment variable is not set"));
    }

    // Package root
    if (sources.package_root && !trim(*sources.package_root).empty()) {
        config.package_root = resolve_path("", trim(*sources.package_root));
    } else if (auto root = env_value(sources.env, PACKAGE_ROOT_ENV)) {
        config.package_root = resolve_path("", *root);
    } else if (file.package_root) {
        config.package_root = resolve_path(file_dir, *file.package_root);
    } else {
        config.package_root = current_directory();
    }

    // Empty keeps relative requirements on the working directory
    if (file.artifact_root) {
        config.artifact_root = resolve_path(file_dir, *file.artifact_root);
    }

    config.output_dir = file.output_dir
        ? resolve_path(file_dir, *file.output_dir)
        : join_path(config.package_root, DEFAULT_SYNTH_DIR);

    if (sources.env) {
        config.stack_selection = sources.env(STACK_SELECTION_ENV);
    }
    config.warnings = std::move(file.warnings);

    return Result<DriverConfig>::ok(std::move(config));
}

void report_config_warnings(const DriverConfig& config, WarningCollector& warnings) {
    bool report = warnings.get_effective_action(warning_to_string(Warning::invalid_configuration)) !=
                  WarningAction::Ignore;
    for (const auto& reason : config.config_warnings) {
        if (report) spdlog::warn("Ignoring config entry ({}) in {}", reason, config.config_path);
        warnings.emit(Warning::invalid_configuration,
                      warnings::invalid_configuration(reason, config.config_path));
    }
}

} // namespace stackreg
