#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace ptrack {

/**
 * @brief Log severity levels
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off"), case-insensitive
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Logger class wrapping spdlog
 *
 * Provides:
 * - Async logging shared by all module loggers
 * - Console sink plus an optional rotating file sink
 * - Module-tagged messages ("tracker", "config", ...)
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Only the first call has an effect.
     *
     * @param log_file Path to log file (empty = console only)
     * @param console_level Minimum level for console output
     * @param file_level Minimum level for file output
     * @return true if the logger is up; false on sink errors or after
     *         shutdown()
     */
    static bool init(const std::string& log_file = "",
                     LogLevel console_level = LogLevel::INFO,
                     LogLevel file_level = LogLevel::DEBUG);

    /**
     * @brief Flush pending messages and drop all loggers
     *
     * Terminal: a later init() does not bring logging back.
     */
    static void shutdown();

    static void flush();

    /**
     * @brief Get or create a logger for a module
     *
     * Falls back to the default logger when init() was never called.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& module);

    /**
     * @brief Get the default logger
     */
    static std::shared_ptr<spdlog::logger> get();
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PTRACK_LOG_TRACE(module, ...) \
    if (auto _log = ::ptrack::Logger::get(module)) _log->trace(__VA_ARGS__)

#define PTRACK_LOG_DEBUG(module, ...) \
    if (auto _log = ::ptrack::Logger::get(module)) _log->debug(__VA_ARGS__)

#define PTRACK_LOG_INFO(module, ...) \
    if (auto _log = ::ptrack::Logger::get(module)) _log->info(__VA_ARGS__)

#define PTRACK_LOG_WARN(module, ...) \
    if (auto _log = ::ptrack::Logger::get(module)) _log->warn(__VA_ARGS__)

#define PTRACK_LOG_ERROR(module, ...) \
    if (auto _log = ::ptrack::Logger::get(module)) _log->error(__VA_ARGS__)

#define PTRACK_LOG_CRITICAL(module, ...) \
    if (auto _log = ::ptrack::Logger::get(module)) _log->critical(__VA_ARGS__)

// Shorthand with default module
#define LOG_TRACE(...) PTRACK_LOG_TRACE("ptrack", __VA_ARGS__)
#define LOG_DEBUG(...) PTRACK_LOG_DEBUG("ptrack", __VA_ARGS__)
#define LOG_INFO(...)  PTRACK_LOG_INFO("ptrack", __VA_ARGS__)
#define LOG_WARN(...)  PTRACK_LOG_WARN("ptrack", __VA_ARGS__)
#define LOG_ERROR(...) PTRACK_LOG_ERROR("ptrack", __VA_ARGS__)
#define LOG_CRITICAL(...) PTRACK_LOG_CRITICAL("ptrack", __VA_ARGS__)

}  // namespace ptrack
