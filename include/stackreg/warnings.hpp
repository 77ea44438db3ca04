#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stackreg {

// ============================================================================
// Warning Keys
// ============================================================================

enum class Warning {
    artifact_missing,        // required artifact absent; stack skipped for this run
    stage_invalid,           // stage entry is not a usable identifier
    selection_unmatched,     // selected name matches no registered stack
    invalid_configuration,   // config file entry ignored
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::artifact_missing: return "artifact_missing";
        case Warning::stage_invalid: return "stage_invalid";
        case Warning::selection_unmatched: return "selection_unmatched";
        case Warning::invalid_configuration: return "invalid_configuration";
    }
    return "unknown";
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
    }
    return "warn";
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

using WarningPolicy = std::unordered_map<std::string, WarningAction>;

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(WarningPolicy policy)
        : policy_(std::move(policy)) {}

    // Emit a warning with fields
    void emit(Warning warning, std::unordered_map<std::string, std::string> fields = {});

    // Emit a warning by key string
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Emitted warnings after policy application; "ignore" entries excluded
    std::vector<WarningObject> get_warnings() const;

    // Warnings of one key after policy application
    std::vector<WarningObject> get_warnings(Warning warning) const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    WarningAction get_effective_action(const std::string& key) const;

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    WarningPolicy policy_;
    std::vector<CollectedWarning> warnings_;
};

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> artifact_missing(
    const std::string& stack,
    const std::string& path,
    const std::string& description) {
    return {{"stack", stack}, {"path", path}, {"description", description}};
}

inline std::unordered_map<std::string, std::string> stage_invalid(
    const std::string& stack,
    const std::string& stage) {
    return {{"stack", stack}, {"stage", stage}};
}

inline std::unordered_map<std::string, std::string> selection_unmatched(
    const std::string& name) {
    return {{"name", name}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace stackreg
