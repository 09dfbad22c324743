#pragma once

/**
 * Logger.hpp
 * 
 * Process-wide logging for the importer, backed by spdlog.
 * Console output follows the configured level; the rotating log file
 * under the data directory always records everything down to trace.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace takeout::core {

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
 * Logger - Thread-safe singleton around one spdlog logger
 * 
 * Until initialize() runs every call is a no-op, which keeps the
 * components usable from unit tests without any logging setup.
 */
class Logger {
public:
    static constexpr size_t MaxFileSize = 10 * 1024 * 1024;
    static constexpr size_t MaxFiles = 5;

    static Logger& instance() {
        static Logger instance;
        return instance;
    }
    
    /**
     * Create the console and file sinks
     * @param level Console level
     * @param logDir Directory for takeout-importer.log (cwd/logs when empty)
     */
    void initialize(LogLevel level = LogLevel::Info, const std::string& logDir = "") {
        std::filesystem::path dir = logDir.empty()
            ? std::filesystem::current_path() / "logs"
            : std::filesystem::path(logDir);

        try {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_level(toSpdlogLevel(level));
            console->set_pattern("%H:%M:%S [%^%l%$] %v");

            std::filesystem::create_directories(dir);
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (dir / "takeout-importer.log").string(), MaxFileSize, MaxFiles);
            file->set_level(spdlog::level::trace);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

            std::vector<spdlog::sink_ptr> sinks{console, file};
            m_logger = std::make_shared<spdlog::logger>("takeout", sinks.begin(), sinks.end());
            m_logger->set_level(spdlog::level::trace);
            m_logger->flush_on(spdlog::level::warn);
            m_consoleSink = console;

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));
            m_initialized = true;

        } catch (const std::exception& ex) {
            // spdlog_ex or filesystem_error: keep going with the console only
            m_logger = spdlog::get("takeout_console");
            if (!m_logger) {
                m_logger = spdlog::stdout_color_mt("takeout_console");
            }
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->warn("File logging unavailable in {}: {}", dir.string(), ex.what());
        }
    }
    
    /**
     * Parse a level name as written in the configuration file
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info) {
        if (name == "trace")    return LogLevel::Trace;
        if (name == "debug")    return LogLevel::Debug;
        if (name == "info")     return LogLevel::Info;
        if (name == "warn")     return LogLevel::Warn;
        if (name == "error")    return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off")      return LogLevel::Off;
        return fallback;
    }

    /**
     * Printable stand-in for a credential: never the value itself
     */
    static std::string redact(const std::string& secret) {
        if (secret.empty()) {
            return "<unset>";
        }
        return "<" + std::to_string(secret.size()) + " chars>";
    }
    
    bool isInitialized() const { return m_initialized; }
    
    /**
     * Change the console level; the file keeps recording at trace
     */
    void setLevel(LogLevel level) {
        if (m_consoleSink) {
            m_consoleSink->set_level(toSpdlogLevel(level));
        } else if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }
    
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }
    
    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->log(toSpdlogLevel(level), fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
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

    std::shared_ptr<spdlog::logger> m_logger;
    spdlog::sink_ptr m_consoleSink;
    bool m_initialized{false};
};

} // namespace takeout::core

#define TAKEOUT_LOG_TRACE(...)    takeout::core::Logger::instance().log(takeout::core::LogLevel::Trace, __VA_ARGS__)
#define TAKEOUT_LOG_DEBUG(...)    takeout::core::Logger::instance().log(takeout::core::LogLevel::Debug, __VA_ARGS__)
#define TAKEOUT_LOG_INFO(...)     takeout::core::Logger::instance().log(takeout::core::LogLevel::Info, __VA_ARGS__)
#define TAKEOUT_LOG_WARN(...)     takeout::core::Logger::instance().log(takeout::core::LogLevel::Warn, __VA_ARGS__)
#define TAKEOUT_LOG_ERROR(...)    takeout::core::Logger::instance().log(takeout::core::LogLevel::Error, __VA_ARGS__)
#define TAKEOUT_LOG_CRITICAL(...) takeout::core::Logger::instance().log(takeout::core::LogLevel::Critical, __VA_ARGS__)
