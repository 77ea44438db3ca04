/**
 * stackreg CLI - list command
 *
 * List registered stacks in deployment order.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace stackreg::cli::commands {

namespace {

nlohmann::json stack_to_json(const StackDescriptor& stack) {
    nlohmann::json j;
    j["name"] = stack.name;
    j["description"] = stack.description;
    j["bootstrap"] = is_bootstrap_stack(stack.name);
    j["output_envelope"] = output_envelope_to_string(stack.output_envelope);
    j["output_schema"] = stack.output_schema.describe();
    if (stack.stages) {
        j["stages"] = *stack.stages;
    }
    if (stack.required_artifacts) {
        j["required_artifacts"] = nlohmann::json::array();
        for (const auto& req : *stack.required_artifacts) {
            j["required_artifacts"].push_back({{"description", req.description},
                                               {"path", req.path}});
        }
    }
    return j;
}

int cmd_list(const GlobalOptions& opts) {
    setup_logging(opts);

    auto config = load_config(opts, false);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return 1;
    }

    auto registry = load_registry(config.value());
    if (registry.isErr()) {
        print_error(registry.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json result;
        result["stacks"] = nlohmann::json::array();
        for (const auto& stack : *registry.value()) {
            result["stacks"].push_back(stack_to_json(stack));
        }
        output_json(result);
        return 0;
    }

    for (const auto& stack : *registry.value()) {
        std::cout << stack.name;
        if (!stack.description.empty()) {
            std::cout << "  " << stack.description;
        }
        std::cout << std::endl;
        if (stack.stages && !stack.stages->empty()) {
            std::cout << "    stages:";
            for (const auto& stage : *stack.stages) std::cout << " " << stage;
            std::cout << std::endl;
        }
        if (stack.required_artifacts) {
            for (const auto& req : *stack.required_artifacts) {
                std::cout << "    requires: " << req.description << " (" << req.path << ")"
                          << std::endl;
            }
        }
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace stackreg::cli::commands
