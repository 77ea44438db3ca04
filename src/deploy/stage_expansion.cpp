#include "stackreg/stage_expansion.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace stackreg {

bool is_valid_stage_name(const std::string& stage) {
    if (stage.empty()) return false;
    for (char ch : stage) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && c != '-' && c != '_') return false;
    }
    return true;
}

std::string stage_instance_id(const std::string& stack_name, const std::string& stage) {
    return stack_name + "-" + stage;
}

StackProps merge_props(const UniversalProps& universal, const StackProps& props) {
    StackProps merged = StackProps::object();
    merged["region"] = universal.region;
    if (props.is_object()) {
        for (auto& [key, val] : props.items()) {
            merged[key] = val;
        }
    }
    return merged;
}

std::vector<StackInstance> expand_stack(const StackDescriptor& stack,
                                        const UniversalProps& universal,
                                        WarningCollector& warnings) {
    std::vector<StackInstance> instances;

    if (!is_bootstrap_stack(stack.name) && stack.stages) {
        for (const auto& stage : *stack.stages) {
            if (!is_valid_stage_name(stage)) {
                if (warnings.get_effective_action(warning_to_string(Warning::stage_invalid)) !=
                    WarningAction::Ignore) {
                    spdlog::warn("Ignoring invalid stage \"{}\" of stack \"{}\"", stage, stack.name);
                }
                warnings.emit(Warning::stage_invalid, warnings::stage_invalid(stack.name, stage));
                continue;
            }

            StackInstance instance;
            instance.id = stage_instance_id(stack.name, stage);
            instance.stack_name = stack.name;
            instance.stage = stage;
            instance.props = merge_props(universal, stack.props);
            instances.push_back(std::move(instance));
        }

        if (!instances.empty()) {
            return instances;
        }
    }

    StackInstance instance;
    instance.id = stack.name;
    instance.stack_name = stack.name;
    instance.props = merge_props(universal, stack.props);
    instances.push_back(std::move(instance));
    return instances;
}

} // namespace stackreg
