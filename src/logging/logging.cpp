#include "stackreg/logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stackreg {

std::optional<std::string> normalize_log_level(const std::string& level) {
    std::string l = level;
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "debug" || l == "trace") return std::string("debug");
    if (l == "info") return std::string("info");
    if (l == "warn" || l == "warning") return std::string("warn");
    if (l == "error" || l == "err") return std::string("error");
    if (l == "off" || l == "none") return std::string("off");
    return std::nullopt;
}

void init_logging(const std::string& level) {
    // stdout carries command output; diagnostics go to stderr
    auto logger = spdlog::get("stackreg");
    if (!logger) {
        logger = spdlog::stderr_color_mt("stackreg");
    }
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    auto normalized = normalize_log_level(level).value_or("info");
    if (normalized == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (normalized == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (normalized == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (normalized == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace stackreg
