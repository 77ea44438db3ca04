/**
 * stackreg CLI - artifacts command
 *
 * List Lambda bundles, where they are staged and whether they exist.
 */

#include "../common.hpp"
#include <stackreg/lambda_artifacts.hpp>
#include <CLI/CLI.hpp>

namespace stackreg::cli::commands {

namespace {

int cmd_artifacts(const GlobalOptions& opts) {
    setup_logging(opts);

    auto config = load_config(opts, false);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return 1;
    }
    const std::string& root = config.value().package_root;

    nlohmann::json result;
    result["artifacts"] = nlohmann::json::array();
    for (const auto& def : lambda_artifact_definitions()) {
        std::string zip = resolve_zip_path(def, root);
        result["artifacts"].push_back({
            {"id", def.id},
            {"stack", def.stack_name},
            {"description", def.description},
            {"source", resolve_source_dist_path(def, root)},
            {"zip", zip},
            {"exists", path_exists(zip)},
        });
    }

    if (opts.json) {
        output_json(result);
        return 0;
    }

    for (const auto& a : result["artifacts"]) {
        std::cout << (a["exists"].get<bool>() ? "[ok]      " : "[missing] ")
                  << a["id"].get<std::string>() << "  " << a["zip"].get<std::string>()
                  << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_artifacts(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_artifacts(opts));
    });
}

} // namespace stackreg::cli::commands
