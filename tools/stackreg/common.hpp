/**
 * stackreg CLI - Common utilities and types
 */

#pragma once

#include <stackreg/catalog.hpp>
#include <stackreg/config.hpp>
#include <stackreg/logging.hpp>
#include <stackreg/registry.hpp>
#include <stackreg/result.hpp>
#include <stackreg/warnings.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace stackreg::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string package_root;      // --package-root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Configure logging from the global flags.
 * Priority: -v > -q > STACKREG_LOG_LEVEL > info
 */
inline void setup_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        init_logging("debug");
    } else if (opts.quiet) {
        init_logging("error");
    } else {
        init_logging(get_env(LOG_LEVEL_ENV).value_or("info"));
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        if (const Error* cause = error.cause()) {
            j["cause"] = {{"code", error_code_to_string(cause->code())},
                          {"message", cause->message()}};
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.describe() << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json warnings_to_json(const WarningCollector& collector) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& w : collector.get_warnings()) {
        out.push_back({{"key", w.key}, {"action", w.action}, {"fields", w.fields}});
    }
    return out;
}

/**
 * Resolve configuration from the environment and the global flags.
 */
inline Result<DriverConfig> load_config(const GlobalOptions& opts, bool require_region) {
    ConfigSources sources;
    sources.env = process_env();
    if (!opts.config.empty()) sources.config_path = opts.config;
    if (!opts.package_root.empty()) sources.package_root = opts.package_root;
    sources.require_region = require_region;
    return load_driver_config(sources);
}

/**
 * Registry of the platform stacks rooted at the configured package root.
 */
inline Result<std::shared_ptr<const StackRegistry>> load_registry(const DriverConfig& config) {
    auto registry = StackRegistry::create(build_default_catalog(process_env(), config.package_root));
    if (registry.isErr()) {
        return Result<std::shared_ptr<const StackRegistry>>::err(registry.error());
    }
    return Result<std::shared_ptr<const StackRegistry>>::ok(
        std::make_shared<const StackRegistry>(std::move(registry.value())));
}

} // namespace stackreg::cli
