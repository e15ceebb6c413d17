#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tokentrail::core {

struct LogConfig {
    std::filesystem::path     directory = "logs";
    std::string               fileName  = "tokentrail.log";
    bool                      toFile    = true;
    bool                      toConsole = true;
    bool                      async     = false;   // spdlog async logger (drops oldest on overflow)
    spdlog::level::level_enum level     = spdlog::level::info;
};

// Builds the "tokentrail" logger and installs it as the spdlog default.
// Falls back to console-only if the log directory cannot be created.
std::shared_ptr<spdlog::logger> InitLogging(const LogConfig& cfg);

// Flushes and drops all registered loggers.
void ShutdownLogging();

// "trace", "debug", "info", "warn", "error", "critical", "off"; anything else -> `def`.
[[nodiscard]] spdlog::level::level_enum ParseLogLevel(std::string_view name,
                                                      spdlog::level::level_enum def) noexcept;

} // namespace tokentrail::core
