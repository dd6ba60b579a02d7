#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace wasmbox::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr: the sandbox executable owns stdout
    // as its protocol channel.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_request_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            request_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (request_id_.empty() ? "" : "[" + request_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string request_id_;
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

    #define LOG_DEBUG(msg) wasmbox::core::logging::Logger::get().log(wasmbox::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  wasmbox::core::logging::Logger::get().log(wasmbox::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  wasmbox::core::logging::Logger::get().log(wasmbox::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) wasmbox::core::logging::Logger::get().log(wasmbox::core::logging::LogLevel::ERROR, msg)

} // namespace wasmbox::core::logging
