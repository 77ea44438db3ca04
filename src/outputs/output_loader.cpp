#include "stackreg/output_loader.hpp"
#include "stackreg/platform.hpp"

#include <chrono>
#include <exception>

#include <spdlog/spdlog.h>

namespace stackreg {

std::string resolve_output_path(const std::string& stack_name, const std::string& base_path) {
    std::string dir = join_path(join_path(base_path, OUTPUTS_SUBDIR), stack_name);
    return join_path(dir, OUTPUTS_FILE);
}

OutputLoader::OutputLoader(std::shared_ptr<const StackRegistry> registry,
                           std::string package_root,
                           FileReader reader,
                           FileExists exists)
    : registry_(std::move(registry)),
      package_root_(std::move(package_root)),
      reader_(std::move(reader)),
      exists_(std::move(exists)) {
    if (!reader_) {
        reader_ = [](const std::string& path) { return read_file(path); };
    }
    if (!exists_) {
        exists_ = [](const std::string& path) { return path_exists(path); };
    }
}

std::string OutputLoader::output_path(const std::string& stack_name,
                                      const std::optional<std::string>& base_path) const {
    return resolve_output_path(stack_name, base_path ? *base_path : package_root_);
}

Result<nlohmann::json> OutputLoader::load(const std::string& stack_name,
                                          const std::optional<std::string>& base_path) {
    const StackDescriptor* stack = registry_->find(stack_name);
    if (stack == nullptr) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::UNKNOWN_STACK, "Unknown stack: " + stack_name));
    }
    if (is_bootstrap_stack(stack_name)) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::UNKNOWN_STACK, "Stack has no consumable outputs: " + stack_name));
    }

    std::promise<Result<nlohmann::json>> promise;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = loads_.find(stack_name);
        if (it != loads_.end()) {
            SharedLoad existing = it->second;
            lock.unlock();
            return existing.get();
        }
        loads_.emplace(stack_name, promise.get_future().share());
    }

    std::string path = output_path(stack_name, base_path);
    auto result = Result<nlohmann::json>::err(Error(ErrorCode::IO_ERROR, "not loaded"));
    try {
        result = read_and_validate(*stack, path);
    } catch (const std::exception& e) {
        result = Result<nlohmann::json>::err(
            Error(ErrorCode::IO_ERROR, e.what()).withContext(path));
    }
    promise.set_value(result);

    if (result.isErr()) {
        // Waiters hold their own copy of the future; later callers start over
        std::lock_guard<std::mutex> lock(mutex_);
        loads_.erase(stack_name);
        spdlog::debug("Loading outputs for {} failed: {}", stack_name, result.error().message());
    } else {
        spdlog::debug("Loaded outputs for {} from {}", stack_name, path);
    }
    return result;
}

Result<nlohmann::json> OutputLoader::read_and_validate(const StackDescriptor& stack,
                                                       const std::string& path) const {
    if (!exists_(path)) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::MISSING_OUTPUT, "Stack output file not found: " + path));
    }

    auto content = reader_(path);
    if (!content) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::IO_ERROR, "Failed to read stack output file: " + path));
    }

    const std::string failure = "Failed to parse output for stack: " + stack.name;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::VALIDATION_ERROR, failure)
                .withCause(Error(ErrorCode::JSON_PARSE_ERROR, e.what())));
    }

    auto report = stack.output_schema.validate(doc);
    if (!report.ok) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::VALIDATION_ERROR, failure)
                .withCause(Error(ErrorCode::SCHEMA_VIOLATION, report.summary())));
    }

    if (stack.output_envelope == OutputEnvelope::Flat) {
        return Result<nlohmann::json>::ok(std::move(report.value));
    }

    if (!report.value.is_object() || !report.value.contains(stack.name)) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::VALIDATION_ERROR, failure)
                .withCause(Error(ErrorCode::SCHEMA_VIOLATION,
                                 "$." + stack.name + ": required")));
    }
    return Result<nlohmann::json>::ok(report.value[stack.name]);
}

bool OutputLoader::is_cached(const std::string& stack_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loads_.find(stack_name);
    if (it == loads_.end()) return false;
    if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
    return it->second.get().isOk();
}

size_t OutputLoader::cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : loads_) {
        if (entry.second.wait_for(std::chrono::seconds(0)) == std::future_status::ready &&
            entry.second.get().isOk()) {
            ++count;
        }
    }
    return count;
}

} // namespace stackreg
