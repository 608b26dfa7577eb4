#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace uploader::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. WARN and ERROR go to stderr.
    class Logger {
    public:
        // Singleton access
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_task_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            task_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            // stdout carries the progress text; problems go to stderr.
            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (task_id_.empty() ? "" : "[" + task_id_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string task_id_;
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

    #define UPLOADER_LOG_DEBUG(msg) uploader::core::logging::Logger::get().log(uploader::core::logging::LogLevel::DEBUG, msg)
    #define UPLOADER_LOG_INFO(msg)  uploader::core::logging::Logger::get().log(uploader::core::logging::LogLevel::INFO, msg)
    #define UPLOADER_LOG_WARN(msg)  uploader::core::logging::Logger::get().log(uploader::core::logging::LogLevel::WARN, msg)
    #define UPLOADER_LOG_ERROR(msg) uploader::core::logging::Logger::get().log(uploader::core::logging::LogLevel::ERROR, msg)

} // namespace uploader::core::logging
