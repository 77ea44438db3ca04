/**
 * stackreg CLI - synth command
 *
 * Select, gate and expand the registered stacks, then write the synthesis
 * manifest.
 */

#include "../common.hpp"
#include <stackreg/deploy.hpp>
#include <CLI/CLI.hpp>

namespace stackreg::cli::commands {

namespace {

struct SynthOptions {
    std::vector<std::string> stacks;
    std::string out;
};

nlohmann::json plan_to_json(const DeploymentPlan& plan) {
    nlohmann::json j;
    j["instances"] = nlohmann::json::array();
    for (const auto& instance : plan.instances) {
        nlohmann::json i;
        i["id"] = instance.id;
        i["stack"] = instance.stack_name;
        if (instance.stage) i["stage"] = *instance.stage;
        j["instances"].push_back(i);
    }
    j["skipped"] = nlohmann::json::array();
    for (const auto& skipped : plan.skipped) {
        nlohmann::json s;
        s["stack"] = skipped.name;
        s["missing"] = nlohmann::json::array();
        for (const auto& m : skipped.missing) {
            s["missing"].push_back({{"description", m.requirement.description},
                                    {"path", m.resolved_path}});
        }
        j["skipped"].push_back(s);
    }
    j["unmatched_selection"] = plan.unmatched_selection;
    return j;
}

int cmd_synth(const GlobalOptions& opts, const SynthOptions& synth_opts) {
    setup_logging(opts);

    auto config = load_config(opts, true);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return 1;
    }
    if (!synth_opts.out.empty()) {
        config.value().output_dir = resolve_path("", synth_opts.out);
    }

    auto registry = load_registry(config.value());
    if (registry.isErr()) {
        print_error(registry.error(), opts.json);
        return 1;
    }

    WarningCollector warnings(config.value().warnings);
    auto result = run_deployment(*registry.value(), config.value(), synth_opts.stacks, warnings);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    const auto& run = result.value();
    if (opts.json) {
        nlohmann::json j = plan_to_json(run.plan);
        j["ok"] = true;
        j["manifest"] = run.manifest_path;
        j["warnings"] = warnings_to_json(warnings);
        output_json(j);
    } else if (!opts.quiet) {
        for (const auto& instance : run.plan.instances) {
            std::cout << instance.id << std::endl;
        }
        std::cout << "Wrote " << run.manifest_path << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_synth(CLI::App* app, GlobalOptions& opts) {
    static SynthOptions synth_opts;

    app->add_option("stacks", synth_opts.stacks, "Stacks to deploy (ignored when STACK is set)");
    app->add_option("--out", synth_opts.out, "Synthesis output directory");

    app->callback([&opts]() {
        std::exit(cmd_synth(opts, synth_opts));
    });
}

} // namespace stackreg::cli::commands
