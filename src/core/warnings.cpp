#include "stackreg/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace stackreg {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string k = to_lower(key);
    if (k == "artifact_missing") return Warning::artifact_missing;
    if (k == "stage_invalid") return Warning::stage_invalid;
    if (k == "selection_unmatched") return Warning::selection_unmatched;
    if (k == "invalid_configuration") return Warning::invalid_configuration;
    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string a = to_lower(s);
    if (a == "warn") return WarningAction::Warn;
    if (a == "ignore") return WarningAction::Ignore;
    if (a == "error") return WarningAction::Error;
    return std::nullopt;
}

void WarningCollector::emit(Warning warning, std::unordered_map<std::string, std::string> fields) {
    emit(std::string(warning_to_string(warning)), std::move(fields));
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    std::string key = to_lower(warning_key);
    WarningAction action = get_effective_action(key);

    // Ignored warnings are kept so has_* queries can see them
    warnings_.push_back({std::move(key), std::move(fields), action});
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }
        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }
    return result;
}

std::vector<WarningObject> WarningCollector::get_warnings(Warning warning) const {
    std::vector<WarningObject> result;
    std::string key = warning_to_string(warning);
    for (auto& w : get_warnings()) {
        if (w.key == key) {
            result.push_back(std::move(w));
        }
    }
    return result;
}

bool WarningCollector::has_errors() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = to_lower(key);

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    return WarningAction::Warn;
}

} // namespace stackreg
