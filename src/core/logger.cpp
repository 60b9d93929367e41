#include "ptrack/core/logger.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ptrack {

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

// Global state
std::once_flag init_flag;
std::mutex logger_mutex;
bool initialized = false;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
std::vector<spdlog::sink_ptr> sinks;

}  // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    return std::nullopt;
}

bool Logger::init(const std::string& log_file,
                  LogLevel console_level,
                  LogLevel file_level) {
    bool ok = true;

    std::call_once(init_flag, [&]() {
        try {
            // Queue size, thread count
            spdlog::init_thread_pool(8192, 1);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(console_level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
            sinks.push_back(console_sink);

            // Rotating, 10MB max, 3 files
            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, 10 * 1024 * 1024, 3);
                file_sink->set_level(to_spdlog_level(file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
                sinks.push_back(file_sink);
            }

            auto default_logger = std::make_shared<spdlog::async_logger>(
                "ptrack", sinks.begin(), sinks.end(),
                spdlog::thread_pool(),
                spdlog::async_overflow_policy::overrun_oldest);

            // Actual filtering happens per sink
            default_logger->set_level(spdlog::level::trace);
            spdlog::register_logger(default_logger);
            spdlog::set_default_logger(default_logger);

            std::lock_guard<std::mutex> lock(logger_mutex);
            loggers["ptrack"] = default_logger;
            initialized = true;

            spdlog::debug("Logging system initialized");

        } catch (const spdlog::spdlog_ex& e) {
            fprintf(stderr, "Logger initialization failed: %s\n", e.what());
            ok = false;
        }
    });

    std::lock_guard<std::mutex> lock(logger_mutex);
    return ok && initialized;
}

// init() is one-shot: after shutdown the logger cannot be initialized
// again and logging stays off for the rest of the process
void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        loggers.clear();
        sinks.clear();
        initialized = false;
    }
    spdlog::shutdown();
}

void Logger::flush() {
    if (auto def = spdlog::default_logger()) {
        def->flush();
    }

    std::lock_guard<std::mutex> lock(logger_mutex);
    for (auto& [name, logger] : loggers) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& module) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    // Module loggers share the async sinks, which only exist after init()
    if (!initialized) {
        return spdlog::default_logger();
    }

    auto it = loggers.find(module);
    if (it != loggers.end()) {
        return it->second;
    }

    try {
        auto logger = std::make_shared<spdlog::async_logger>(
            module, sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);

        logger->set_level(spdlog::level::trace);
        spdlog::register_logger(logger);
        loggers[module] = logger;

        return logger;

    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    return spdlog::default_logger();
}

}  // namespace ptrack
