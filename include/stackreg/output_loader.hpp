#pragma once

/**
 * @file output_loader.hpp
 * @brief Memoized, thread-safe access to deployed stack outputs
 *
 * Each registered stack writes its outputs to
 * <base>/cdktf-outputs/stacks/<stack-name>/outputs.json during deployment.
 * The loader reads that file on first use, validates it against the
 * stack's output schema and keeps the result for the lifetime of the
 * loader. Concurrent first requests for one stack share a single read.
 *
 * @example
 * ```cpp
 * auto registry = std::make_shared<const stackreg::StackRegistry>(...);
 * stackreg::OutputLoader loader(registry, package_root);
 * auto tables = loader.load_as<stackreg::ApiStackOutputs>("myapp-api-stack");
 * if (tables.isErr()) {
 *     spdlog::error("{}", tables.error().describe());
 * }
 * ```
 */

#include "stackreg/registry.hpp"
#include "stackreg/result.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace stackreg {

// Relative location of stack outputs under a base path
constexpr const char* OUTPUTS_SUBDIR = "cdktf-outputs/stacks";
constexpr const char* OUTPUTS_FILE = "outputs.json";

// Reads a whole file; nullopt when it cannot be read
using FileReader = std::function<std::optional<std::string>(const std::string& path)>;

// Tells MISSING_OUTPUT apart from an unreadable file
using FileExists = std::function<bool(const std::string& path)>;

// "<base>/cdktf-outputs/stacks/<stack-name>/outputs.json"
std::string resolve_output_path(const std::string& stack_name, const std::string& base_path);

class OutputLoader {
public:
    /**
     * @param registry     stacks the loader may serve
     * @param package_root default base path for output files
     * @param reader       file reader; the filesystem when empty
     * @param exists       existence check; the filesystem when empty
     */
    OutputLoader(std::shared_ptr<const StackRegistry> registry,
                 std::string package_root,
                 FileReader reader = {},
                 FileExists exists = {});

    OutputLoader(const OutputLoader&) = delete;
    OutputLoader& operator=(const OutputLoader&) = delete;

    /**
     * @brief Validated outputs of one stack
     *
     * The first successful result for a name is returned by every later
     * call, whatever base_path they pass. Failures are shared by callers
     * already waiting on the same load but are not kept; the next call
     * tries again.
     *
     * Errors: UNKNOWN_STACK, MISSING_OUTPUT, VALIDATION_ERROR (cause
     * JSON_PARSE_ERROR or SCHEMA_VIOLATION), IO_ERROR.
     */
    Result<nlohmann::json> load(const std::string& stack_name,
                                const std::optional<std::string>& base_path = std::nullopt);

    /// load() converted through the type's from_json
    template<typename T>
    Result<T> load_as(const std::string& stack_name,
                      const std::optional<std::string>& base_path = std::nullopt) {
        auto loaded = load(stack_name, base_path);
        if (loaded.isErr()) {
            return Result<T>::err(loaded.error());
        }
        try {
            return Result<T>::ok(loaded.value().template get<T>());
        } catch (const nlohmann::json::exception& e) {
            return Result<T>::err(
                Error(ErrorCode::VALIDATION_ERROR,
                      "Failed to convert output for stack: " + stack_name)
                    .withCause(Error(ErrorCode::SCHEMA_VIOLATION, e.what())));
        }
    }

    /// Output path this loader would use for a stack
    std::string output_path(const std::string& stack_name,
                            const std::optional<std::string>& base_path = std::nullopt) const;

    bool is_cached(const std::string& stack_name) const;
    size_t cached_count() const;

    const std::string& package_root() const { return package_root_; }
    const StackRegistry& registry() const { return *registry_; }

private:
    using SharedLoad = std::shared_future<Result<nlohmann::json>>;

    Result<nlohmann::json> read_and_validate(const StackDescriptor& stack,
                                             const std::string& path) const;

    std::shared_ptr<const StackRegistry> registry_;
    std::string package_root_;
    FileReader reader_;
    FileExists exists_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SharedLoad> loads_;
};

} // namespace stackreg
