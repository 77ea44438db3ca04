/**
 * stackreg CLI - output and path commands
 *
 * Read a stack's deployment outputs the way services do.
 */

#include "../common.hpp"
#include <stackreg/output_loader.hpp>
#include <CLI/CLI.hpp>

namespace stackreg::cli::commands {

namespace {

struct OutputOptions {
    std::string stack;
    std::string outputs_dir;
};

std::optional<std::string> base_override(const OutputOptions& o) {
    if (o.outputs_dir.empty()) return std::nullopt;
    return resolve_path("", o.outputs_dir);
}

int cmd_output(const GlobalOptions& opts, const OutputOptions& out_opts) {
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

    OutputLoader loader(registry.value(), config.value().package_root);
    auto output = loader.load(out_opts.stack, base_override(out_opts));
    if (output.isErr()) {
        print_error(output.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"stack", out_opts.stack}, {"outputs", output.value()}});
    } else {
        std::cout << output.value().dump(2) << std::endl;
    }
    return 0;
}

int cmd_path(const GlobalOptions& opts, const OutputOptions& out_opts) {
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
    if (!registry.value()->contains(out_opts.stack)) {
        print_error(Error(ErrorCode::UNKNOWN_STACK, "Unknown stack: " + out_opts.stack), opts.json);
        return 1;
    }

    OutputLoader loader(registry.value(), config.value().package_root);
    std::string path = loader.output_path(out_opts.stack, base_override(out_opts));

    if (opts.json) {
        output_json({{"stack", out_opts.stack},
                     {"path", path},
                     {"exists", path_exists(path)}});
    } else {
        std::cout << path << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_output(CLI::App* app, GlobalOptions& opts) {
    static OutputOptions out_opts;

    app->add_option("stack", out_opts.stack, "Stack name")->required();
    app->add_option("--outputs-dir", out_opts.outputs_dir, "Base directory holding cdktf-outputs/");

    app->callback([&opts]() {
        std::exit(cmd_output(opts, out_opts));
    });
}

void setup_path(CLI::App* app, GlobalOptions& opts) {
    static OutputOptions path_opts;

    app->add_option("stack", path_opts.stack, "Stack name")->required();
    app->add_option("--outputs-dir", path_opts.outputs_dir, "Base directory holding cdktf-outputs/");

    app->callback([&opts]() {
        std::exit(cmd_path(opts, path_opts));
    });
}

} // namespace stackreg::cli::commands
