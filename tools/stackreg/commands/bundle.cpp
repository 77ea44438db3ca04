/**
 * stackreg CLI - bundle-outputs command
 *
 * Copy deployed stack outputs into a service's dist directory so that the
 * service can read them with the bundled base path.
 */

#include "../common.hpp"
#include <stackreg/output_bundle.hpp>
#include <CLI/CLI.hpp>

namespace stackreg::cli::commands {

namespace {

struct BundleOptions {
    std::string from;   // outputs root; <package_root>/cdktf-outputs by default
    std::string dist;   // <package_root>/dist by default
};

int cmd_bundle_outputs(const GlobalOptions& opts, const BundleOptions& bundle_opts) {
    setup_logging(opts);

    auto config = load_config(opts, false);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return 1;
    }
    const std::string& root = config.value().package_root;

    std::string from = bundle_opts.from.empty()
        ? join_path(root, OUTPUTS_ROOT)
        : resolve_path("", bundle_opts.from);
    std::string dist = bundle_opts.dist.empty()
        ? join_path(root, DIST_DIR)
        : resolve_path("", bundle_opts.dist);

    auto bundled = bundle_outputs(from, dist);
    if (bundled.isErr()) {
        print_error(bundled.error(), opts.json);
        return 1;
    }
    const auto& result = bundled.value();

    if (opts.json) {
        output_json({{"ok", true},
                     {"source", result.source_root},
                     {"source_found", result.source_found},
                     {"destination", result.dest_root},
                     {"copied", result.copied}});
        return 0;
    }

    if (!result.source_found) {
        std::cout << "No deployed outputs at " << result.source_root << std::endl;
        return 0;
    }
    for (const auto& rel : result.copied) {
        std::cout << rel << std::endl;
    }
    std::cout << "Copied " << result.copied.size() << " file(s) to " << result.dest_root
              << std::endl;
    return 0;
}

} // anonymous namespace

void setup_bundle_outputs(CLI::App* app, GlobalOptions& opts) {
    static BundleOptions bundle_opts;

    app->add_option("--from", bundle_opts.from, "Deployed outputs directory (cdktf-outputs/)");
    app->add_option("--dist", bundle_opts.dist, "Service dist directory to copy into");

    app->callback([&opts]() {
        std::exit(cmd_bundle_outputs(opts, bundle_opts));
    });
}

} // namespace stackreg::cli::commands
