#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stackreg {

// Environment variable holding a comma-separated stack selection
constexpr const char* STACK_SELECTION_ENV = "STACK";

// ============================================================================
// Selection Set
// ============================================================================

/**
 * Stacks an invocation acts on. An absent name set matches every stack.
 */
struct SelectionSet {
    std::optional<std::set<std::string>> names;

    static SelectionSet all() { return SelectionSet{}; }
    static SelectionSet of(std::set<std::string> selected) {
        return SelectionSet{std::move(selected)};
    }

    bool matches_all() const { return !names.has_value(); }
    bool matches(const std::string& stack_name) const {
        return !names || names->count(stack_name) > 0;
    }
};

// ============================================================================
// Selection Sources
// ============================================================================

// Split on ',', trim, drop blanks; order kept, duplicates dropped
std::vector<std::string> parse_env_selection(const std::optional<std::string>& value);

// True for tokens ending in .ts, .tsx, .js, .jsx, .mjs or .cjs
bool looks_like_script_path(const std::string& token);

// Positional stack names from argv (program name already removed):
// a leading script path is dropped, as are blank and "-"-prefixed tokens
std::vector<std::string> parse_cli_selection(const std::vector<std::string>& args);

/**
 * Resolve the effective selection.
 *
 * A non-empty environment selection wins outright and the arguments are not
 * consulted. Otherwise the arguments decide. When both are empty every stack
 * is selected.
 */
SelectionSet resolve_selection(const std::optional<std::string>& env_value,
                               const std::vector<std::string>& args);

} // namespace stackreg
