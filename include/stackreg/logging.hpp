#pragma once

#include <optional>
#include <string>

namespace stackreg {

// Environment variable consulted when no level is given explicitly
constexpr const char* LOG_LEVEL_ENV = "STACKREG_LOG_LEVEL";

// "debug", "info", "warn", "error" or "off"; nullopt for anything else
std::optional<std::string> normalize_log_level(const std::string& level);

// Route the default spdlog logger to stderr and set its level. Unknown
// levels fall back to "info".
void init_logging(const std::string& level);

} // namespace stackreg
