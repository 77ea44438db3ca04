#include "stackreg/synth.hpp"
#include "stackreg/platform.hpp"

#include <spdlog/spdlog.h>

namespace stackreg {

bool SynthApp::add_stack(SynthesizedStack stack) {
    if (find(stack.id) != nullptr) {
        spdlog::error("Stack id \"{}\" is already defined in this app", stack.id);
        rejected_ids_.push_back(stack.id);
        return false;
    }
    spdlog::debug("Defined stack {} ({})", stack.id, stack.kind);
    stacks_.push_back(std::move(stack));
    return true;
}

const SynthesizedStack* SynthApp::find(const std::string& id) const {
    for (const auto& s : stacks_) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

nlohmann::json SynthApp::manifest() const {
    nlohmann::json j;
    j["$schema"] = SYNTH_MANIFEST_SCHEMA;
    j["stacks"] = nlohmann::json::array();
    for (const auto& s : stacks_) {
        j["stacks"].push_back({
            {"id", s.id},
            {"kind", s.kind},
            {"props", s.props},
        });
    }
    return j;
}

Result<std::string> SynthApp::synth() const {
    if (!rejected_ids_.empty()) {
        std::string ids;
        for (const auto& id : rejected_ids_) {
            if (!ids.empty()) ids += ", ";
            ids += id;
        }
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_REGISTRY, "duplicate stack ids in app: " + ids));
    }

    if (!create_directories(out_dir_)) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "failed to create synth directory: " + out_dir_));
    }

    std::string path = join_path(out_dir_, "manifest.json");
    auto written = atomic_write_file(path, manifest().dump(2) + "\n");
    if (!written.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, written.error).withContext(path));
    }

    spdlog::info("Synthesized {} stack(s) into {}", stacks_.size(), path);
    return Result<std::string>::ok(path);
}

} // namespace stackreg
