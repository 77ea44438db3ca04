#include "stackreg/registry.hpp"
#include "stackreg/stage_expansion.hpp"

#include <unordered_set>

namespace stackreg {

bool is_bootstrap_stack(const std::string& name) {
    if (name == BOOTSTRAP_STACK_NAME) return true;
    const std::string suffix = BOOTSTRAP_STACK_SUFFIX;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

namespace {

Error registry_error(const std::string& message) {
    return Error(ErrorCode::INVALID_REGISTRY, message);
}

} // namespace

StackRegistry::StackRegistry(std::vector<StackDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        index_.emplace(descriptors_[i].name, i);
    }
}

Result<StackRegistry> StackRegistry::create(std::vector<StackDescriptor> descriptors) {
    std::unordered_set<std::string> names;

    for (const auto& d : descriptors) {
        if (d.name.empty()) {
            return Result<StackRegistry>::err(registry_error("stack name must not be empty"));
        }
        if (!names.insert(d.name).second) {
            return Result<StackRegistry>::err(registry_error("duplicate stack name: " + d.name));
        }
        if (!d.constructor) {
            return Result<StackRegistry>::err(
                registry_error("stack has no constructor: " + d.name));
        }
        if (!d.props.is_object()) {
            return Result<StackRegistry>::err(
                registry_error("stack props must be an object: " + d.name));
        }
    }

    // A stage instance id must not shadow another stack
    for (const auto& d : descriptors) {
        if (!d.stages || is_bootstrap_stack(d.name)) continue;
        for (const auto& stage : *d.stages) {
            if (!is_valid_stage_name(stage)) continue;
            std::string id = stage_instance_id(d.name, stage);
            if (names.count(id) > 0) {
                return Result<StackRegistry>::err(
                    registry_error("stage instance " + id + " of stack " + d.name +
                                   " collides with a registered stack"));
            }
        }
    }

    return Result<StackRegistry>::ok(StackRegistry(std::move(descriptors)));
}

const StackDescriptor* StackRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &descriptors_[it->second];
}

std::vector<std::string> StackRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(descriptors_.size());
    for (const auto& d : descriptors_) {
        out.push_back(d.name);
    }
    return out;
}

} // namespace stackreg
