#include "stackreg/selection.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace stackreg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void push_unique(std::vector<std::string>& out, std::string value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(std::move(value));
    }
}

} // namespace

std::vector<std::string> parse_env_selection(const std::optional<std::string>& value) {
    std::vector<std::string> result;
    if (!value) {
        return result;
    }

    size_t start = 0;
    while (start <= value->size()) {
        size_t comma = value->find(',', start);
        if (comma == std::string::npos) comma = value->size();
        std::string name = trim(value->substr(start, comma - start));
        if (!name.empty()) {
            push_unique(result, std::move(name));
        }
        start = comma + 1;
    }
    return result;
}

bool looks_like_script_path(const std::string& token) {
    static const char* const extensions[] = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs"};
    for (const char* ext : extensions) {
        if (ends_with(token, ext)) return true;
    }
    return false;
}

std::vector<std::string> parse_cli_selection(const std::vector<std::string>& args) {
    std::vector<std::string> result;

    size_t first = 0;
    if (!args.empty() && looks_like_script_path(args[0])) {
        first = 1;
    }

    for (size_t i = first; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (trim(arg).empty()) continue;
        if (arg[0] == '-') continue;
        push_unique(result, arg);
    }
    return result;
}

SelectionSet resolve_selection(const std::optional<std::string>& env_value,
                               const std::vector<std::string>& args) {
    auto from_env = parse_env_selection(env_value);
    if (!from_env.empty()) {
        spdlog::debug("Stack selection from {}: {} stack(s)", STACK_SELECTION_ENV, from_env.size());
        return SelectionSet::of(std::set<std::string>(from_env.begin(), from_env.end()));
    }

    auto from_cli = parse_cli_selection(args);
    if (from_cli.empty()) {
        spdlog::debug("No stack selection given; all stacks eligible");
        return SelectionSet::all();
    }

    spdlog::debug("Stack selection from arguments: {} stack(s)", from_cli.size());
    return SelectionSet::of(std::set<std::string>(from_cli.begin(), from_cli.end()));
}

} // namespace stackreg
