#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace toolgate::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every conversation shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_conversation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            conversation_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        // Goes to stderr: stdout is reserved for the trace and the answer.
        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (conversation_id_.empty() ? "" : "[" + conversation_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string conversation_id_;
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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define TOOLGATE_LOG_DEBUG(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::DEBUG, msg)
    #define TOOLGATE_LOG_INFO(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::INFO, msg)
    #define TOOLGATE_LOG_WARN(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::WARN, msg)
    #define TOOLGATE_LOG_ERROR(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::ERROR, msg)

} // namespace toolgate::core::logging
