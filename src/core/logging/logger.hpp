#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace conductor::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger shared by the whole process
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

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The CLI streams events on stdout, so it points logs at stderr.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
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
            *out_ << "[" << level_to_string(level) << "] "
                  << (context_.empty() ? "" : "[" + context_ + "] ")
                  << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& level) {
            if (text == "debug") { level = LogLevel::DEBUG; return true; }
            if (text == "info")  { level = LogLevel::INFO;  return true; }
            if (text == "warn")  { level = LogLevel::WARN;  return true; }
            if (text == "error") { level = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cout;

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

    // 3. Helper macros used everywhere else
    #define LOG_DEBUG(msg) conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) conductor::core::logging::Logger::get().log(conductor::core::logging::LogLevel::ERROR, msg)

} // namespace conductor::core::logging
