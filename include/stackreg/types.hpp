#pragma once

#include "stackreg/output_schema.hpp"
#include "stackreg/result.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stackreg {

class SynthApp;

// ============================================================================
// Stack Properties
// ============================================================================

// Stack-specific properties; always a JSON object
using StackProps = nlohmann::json;

// Properties every stack receives from the driver
struct UniversalProps {
    std::string region;
};

// ============================================================================
// Artifact Requirement
// ============================================================================

struct ArtifactRequirement {
    std::string path;         // relative paths resolve against the gate's base directory
    std::string description;
};

// ============================================================================
// Output Envelope
// ============================================================================

enum class OutputEnvelope {
    Namespaced,  // { "<stack-name>": { ...outputs } }
    Flat         // { ...outputs }
};

inline const char* output_envelope_to_string(OutputEnvelope e) {
    switch (e) {
        case OutputEnvelope::Namespaced: return "namespaced";
        case OutputEnvelope::Flat: return "flat";
    }
    return "namespaced";
}

// ============================================================================
// Stack Descriptor
// ============================================================================

// Produces the deployable unit for one instance inside scope. Opaque to the
// registry; a failure aborts the run.
using StackConstructor =
    std::function<Result<void>(SynthApp& scope, const std::string& id, const StackProps& props)>;

struct StackDescriptor {
    std::string name;
    std::string description;
    StackConstructor constructor;
    StackProps props = StackProps::object();
    OutputSchema output_schema = OutputSchema::object({});
    OutputEnvelope output_envelope = OutputEnvelope::Namespaced;
    std::optional<std::vector<std::string>> stages;
    std::optional<std::vector<ArtifactRequirement>> required_artifacts;
};

// ============================================================================
// Stack Instance
// ============================================================================

// One planned instantiation of a descriptor
struct StackInstance {
    std::string id;                    // "<name>" or "<name>-<stage>"
    std::string stack_name;
    std::optional<std::string> stage;
    StackProps props;                  // universal props merged with stack props
};

// ============================================================================
// Bootstrap Convention
// ============================================================================

constexpr const char* BOOTSTRAP_STACK_NAME = "bootstrap";
constexpr const char* BOOTSTRAP_STACK_SUFFIX = "-bootstrap-stack";

// True for "bootstrap" and for any "<prefix>-bootstrap-stack"
bool is_bootstrap_stack(const std::string& name);

} // namespace stackreg
