/**
 * stackreg CLI - Entry Point
 *
 * Stack registry and deployment output command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace stackreg::cli::commands {
    void setup_synth(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_output(CLI::App* app, GlobalOptions& opts);
    void setup_path(CLI::App* app, GlobalOptions& opts);
    void setup_artifacts(CLI::App* app, GlobalOptions& opts);
    void setup_bundle_outputs(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace stackreg::cli;

    CLI::App app{"stackreg - stack registry and deployment outputs"};
    app.set_version_flag("-V,--version", STACKREG_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--package-root", opts.package_root, "Package root directory");
    app.add_option("--config", opts.config, "Config file (stackreg.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* synth_cmd = app.add_subcommand("synth", "Plan and synthesize the selected stacks");
    commands::setup_synth(synth_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List registered stacks");
    commands::setup_list(list_cmd, opts);

    auto* output_cmd = app.add_subcommand("output", "Print a stack's validated outputs");
    commands::setup_output(output_cmd, opts);

    auto* path_cmd = app.add_subcommand("path", "Print where a stack's outputs are read from");
    commands::setup_path(path_cmd, opts);

    auto* artifacts_cmd = app.add_subcommand("artifacts", "List Lambda bundles and whether they are staged");
    commands::setup_artifacts(artifacts_cmd, opts);

    auto* bundle_cmd = app.add_subcommand("bundle-outputs", "Copy deployed outputs into a service's dist directory");
    commands::setup_bundle_outputs(bundle_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
