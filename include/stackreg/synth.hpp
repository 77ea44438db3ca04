#pragma once

#include "stackreg/result.hpp"
#include "stackreg/types.hpp"

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace stackreg {

// Schema identifier written into the synthesis manifest
constexpr const char* SYNTH_MANIFEST_SCHEMA = "stackreg.synth.manifest.v1";

// Default synthesis output directory, relative to the package root
constexpr const char* DEFAULT_SYNTH_DIR = "cdktf.out";

// ============================================================================
// Synthesized Stack
// ============================================================================

struct SynthesizedStack {
    std::string id;          // instance id, unique within one app
    std::string kind;        // what the constructor provisions, e.g. "api"
    StackProps props;
};

// ============================================================================
// Synthesis Scope
// ============================================================================

/**
 * @brief Scope handed to stack constructors
 *
 * Constructors register the unit they produce with add_stack(). synth()
 * writes the collected units as a manifest, in registration order.
 */
class SynthApp {
public:
    explicit SynthApp(std::string out_dir = DEFAULT_SYNTH_DIR)
        : out_dir_(std::move(out_dir)) {}

    // Register a unit. A repeated id is rejected, logged and remembered so
    // synth() fails.
    bool add_stack(SynthesizedStack stack);

    const std::vector<SynthesizedStack>& stacks() const { return stacks_; }
    const SynthesizedStack* find(const std::string& id) const;
    const std::string& out_dir() const { return out_dir_; }

    nlohmann::json manifest() const;

    // Write <out_dir>/manifest.json atomically; returns the written path
    Result<std::string> synth() const;

private:
    std::string out_dir_;
    std::vector<SynthesizedStack> stacks_;
    std::vector<std::string> rejected_ids_;
};

} // namespace stackreg
