#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace draftline::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Everything goes to stderr: stdout carries the stdio transport's protocol frames.
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) draftline::core::logging::Logger::get().log(draftline::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  draftline::core::logging::Logger::get().log(draftline::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  draftline::core::logging::Logger::get().log(draftline::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) draftline::core::logging::Logger::get().log(draftline::core::logging::LogLevel::ERROR, msg)

} // namespace draftline::core::logging
