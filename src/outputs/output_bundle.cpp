#include "stackreg/output_bundle.hpp"
#include "stackreg/output_loader.hpp"
#include "stackreg/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace stackreg {

namespace fs = std::filesystem;

namespace {

Result<std::vector<fs::path>> find_output_files(const fs::path& root) {
    std::vector<fs::path> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().filename() == fs::path(OUTPUTS_FILE)) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        return Result<std::vector<fs::path>>::err(
            Error(ErrorCode::IO_ERROR, "failed to scan outputs directory: " + ec.message())
                .withContext(root.generic_string()));
    }
    std::sort(found.begin(), found.end());
    return Result<std::vector<fs::path>>::ok(std::move(found));
}

} // namespace

Result<BundleOutputsResult> bundle_outputs(const std::string& source_root,
                                           const std::string& dist_dir) {
    BundleOutputsResult result;
    result.source_root = resolve_path("", source_root);
    std::string dist = resolve_path("", dist_dir);
    result.dest_root = join_path(dist, OUTPUTS_ROOT);

    if (!path_exists(result.source_root)) {
        spdlog::warn("CDK outputs directory not found: {}", result.source_root);
        return Result<BundleOutputsResult>::ok(std::move(result));
    }
    result.source_found = true;

    if (!path_exists(dist)) {
        return Result<BundleOutputsResult>::err(
            Error(ErrorCode::IO_ERROR, "Dist directory not found: " + dist));
    }

    if (!create_directories(result.dest_root)) {
        return Result<BundleOutputsResult>::err(
            Error(ErrorCode::IO_ERROR, "failed to create directory: " + result.dest_root));
    }

    auto files = find_output_files(result.source_root);
    if (files.isErr()) {
        return Result<BundleOutputsResult>::err(files.error());
    }

    const fs::path source(result.source_root);
    const fs::path dest(result.dest_root);
    for (const auto& file : files.value()) {
        fs::path rel = file.lexically_relative(source);
        fs::path target = dest / rel;

        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (!ec) {
            fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            return Result<BundleOutputsResult>::err(
                Error(ErrorCode::IO_ERROR, "failed to copy " + file.generic_string() + ": " +
                                               ec.message())
                    .withContext(target.generic_string()));
        }
        spdlog::debug("Copied {} to {}", file.generic_string(), target.generic_string());
        result.copied.push_back(rel.generic_string());
    }

    if (result.copied.empty()) {
        spdlog::warn("No {} files found to copy in {}", OUTPUTS_FILE, result.source_root);
    } else {
        spdlog::info("Copied {} {} file(s) to {}", result.copied.size(), OUTPUTS_FILE,
                     result.dest_root);
    }
    return Result<BundleOutputsResult>::ok(std::move(result));
}

} // namespace stackreg
