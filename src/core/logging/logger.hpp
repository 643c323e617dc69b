#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace bridge::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Process-wide logger. Writes to stderr so stdout stays free for
    // JSON output of the CLI.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) bridge::core::logging::Logger::get().log(bridge::core::logging::LogLevel::ERROR, msg)

} // namespace bridge::core::logging
