#pragma once
#include <functional>
#include <iostream>
#include <string>
#include <mutex>
#include <utility>

namespace seoflow::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    using LogSink = std::function<void(LogLevel, const std::string&)>;

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Replaces stdout output; an empty sink restores it.
        void set_sink(LogSink sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::move(sink);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            const std::string line =
                (session_id_.empty() ? "" : "[" + session_id_ + "] ") + message;
            if (sink_) {
                sink_(level, line);
                return;
            }
            std::cout << "[" << level_to_string(level) << "] " << line << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& level) {
            if (text == "DEBUG") { level = LogLevel::DEBUG; return true; }
            if (text == "INFO")  { level = LogLevel::INFO;  return true; }
            if (text == "WARN" || text == "WARNING") { level = LogLevel::WARN; return true; }
            if (text == "ERROR") { level = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::DEBUG;
        LogSink sink_;

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
    #define LOG_DEBUG(msg) seoflow::core::logging::Logger::get().log(seoflow::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  seoflow::core::logging::Logger::get().log(seoflow::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  seoflow::core::logging::Logger::get().log(seoflow::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) seoflow::core::logging::Logger::get().log(seoflow::core::logging::LogLevel::ERROR, msg)

} // namespace seoflow::core::logging
