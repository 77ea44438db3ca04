#pragma once

/**
 * @file registry.hpp
 * @brief Ordered, immutable catalog of stack descriptors
 *
 * The registry is built once from a list of descriptors in deployment
 * dependency order (bootstrap first). Construction enforces integrity and
 * fails with INVALID_REGISTRY instead of dropping entries.
 *
 * @example
 * ```cpp
 * auto registry = stackreg::StackRegistry::create(descriptors);
 * if (registry.isErr()) {
 *     spdlog::error("{}", registry.error().message());
 *     return 1;
 * }
 * for (const auto& stack : registry.value()) {
 *     std::cout << stack.name << "\n";
 * }
 * ```
 */

#include "stackreg/result.hpp"
#include "stackreg/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace stackreg {

class StackRegistry {
public:
    using const_iterator = std::vector<StackDescriptor>::const_iterator;

    /**
     * @brief Validate and build a registry
     *
     * Fails when a name is empty or repeated, when a descriptor has no
     * constructor, when props is not an object, or when a stage instance id
     * "<name>-<stage>" equals another registered name.
     */
    static Result<StackRegistry> create(std::vector<StackDescriptor> descriptors);

    const_iterator begin() const { return descriptors_.begin(); }
    const_iterator end() const { return descriptors_.end(); }
    size_t size() const { return descriptors_.size(); }
    bool empty() const { return descriptors_.empty(); }

    /// Descriptor by name, nullptr when not registered
    const StackDescriptor* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Names in registration order
    std::vector<std::string> names() const;

private:
    explicit StackRegistry(std::vector<StackDescriptor> descriptors);

    std::vector<StackDescriptor> descriptors_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace stackreg
