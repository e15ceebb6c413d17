#include "tokentrail/core/Log.hpp"

#include <mutex>
#include <system_error>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace tokentrail::core {

namespace {

void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum level) {
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace

std::shared_ptr<spdlog::logger> InitLogging(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (cfg.toConsole)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (cfg.toFile) {
        std::error_code ec;
        fs::create_directories(cfg.directory, ec);
        if (ec) {
            // Keep going with whatever sinks we have; the warning lands once the logger exists.
            spdlog::warn("InitLogging: cannot create {} ({})", cfg.directory.string(), ec.message());
        } else {
            const auto log_path = cfg.directory / cfg.fileName;
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("InitLogging: cannot open {} ({})", log_path.string(), e.what());
            }
        }
    }

    // Replace any logger from an earlier call.
    spdlog::drop("tokentrail");

    std::shared_ptr<spdlog::logger> logger;
    if (cfg.async) {
        static std::once_flag s_thread_pool_once;
        std::call_once(s_thread_pool_once, [] {
            spdlog::init_thread_pool(8192, 1);
        });

        logger = std::make_shared<spdlog::async_logger>(
            "tokentrail",
            sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>("tokentrail", sinks.begin(), sinks.end());
    }

    configure_default_logger(logger, cfg.level);
    spdlog::info("Logging started (level={}, async={}, file={})",
                 spdlog::level::to_string_view(cfg.level), cfg.async, cfg.toFile);
    return logger;
}

void ShutdownLogging()
{
    spdlog::shutdown();
}

spdlog::level::level_enum ParseLogLevel(std::string_view name, spdlog::level::level_enum def) noexcept
{
    struct Entry { std::string_view name; spdlog::level::level_enum level; };
    static constexpr Entry kLevels[] = {
        { "trace",    spdlog::level::trace },
        { "debug",    spdlog::level::debug },
        { "info",     spdlog::level::info },
        { "warn",     spdlog::level::warn },
        { "warning",  spdlog::level::warn },
        { "error",    spdlog::level::err },
        { "critical", spdlog::level::critical },
        { "off",      spdlog::level::off },
    };

    for (const Entry& e : kLevels) {
        if (e.name == name)
            return e.level;
    }
    return def;
}

} // namespace tokentrail::core
