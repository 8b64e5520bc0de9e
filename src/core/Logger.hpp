#pragma once

/**
 * Logger.hpp
 *
 * Logging front-end used by every daemon component.
 * Uses spdlog as the underlying logging library.
 *
 * Loggers are handed to the components that need them. A default-constructed
 * Logger has no sinks and discards everything, so components can always hold
 * a valid pointer.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace stevedore::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Parse a level name as found in the configuration file
 * @param name Level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 * @return Matching level, Info for unknown names
 */
inline LogLevel parseLogLevel(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

/**
 * Logger class - thread-safe wrapper around an spdlog logger
 *
 * Provides formatted logging with multiple output sinks:
 * - Console output with colors
 * - Rotating file output
 */
class Logger {
public:
    /**
     * Construct a logger that discards all output
     */
    Logger() = default;

    /**
     * Wrap an existing spdlog logger
     * @param logger spdlog logger (may be null)
     */
    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {}

    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Create the daemon logger
     * @param name Logger name
     * @param level Minimum log level
     * @param logDir Log file directory (empty = console only)
     * @return Shared logger instance
     */
    static std::shared_ptr<Logger> create(const std::string& name,
                                          LogLevel level = LogLevel::Info,
                                          const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink with colors
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            // File sink
            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / (name + ".log");
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    true              // Rotate on open
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(toSpdlogLevel(level));
            logger->flush_on(spdlog::level::warn);

            return std::make_shared<Logger>(std::move(logger));

        } catch (const spdlog::spdlog_ex& ex) {
            // Fallback to basic console logging
            auto fallback = std::make_shared<spdlog::logger>(
                name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            fallback->error("Logger initialization failed: {}", ex.what());
            return std::make_shared<Logger>(std::move(fallback));
        }
    }

    /**
     * Create a logger that discards everything
     */
    static std::shared_ptr<Logger> null() {
        return std::make_shared<Logger>();
    }

    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    /**
     * Convert LogLevel to spdlog::level
     */
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

using LoggerPtr = std::shared_ptr<Logger>;

/**
 * Return the given logger, or a discarding one if it is null
 */
inline LoggerPtr orNullLogger(LoggerPtr logger) {
    return logger ? std::move(logger) : Logger::null();
}

} // namespace stevedore::core
