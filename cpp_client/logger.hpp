#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static void Log(LogLevel level, const std::string& message, const std::string& component = "Transfer") {
        if (level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        json log_entry;
        log_entry["timestamp"] = GetTimestamp();
        log_entry["level"] = LevelToString(level);
        log_entry["component"] = component;
        log_entry["message"] = message;

        std::lock_guard<std::mutex> lock(mutex_);
        std::clog << log_entry.dump() << std::endl;
    }

    static void Debug(const std::string& message, const std::string& component = "Transfer") {
        Log(LogLevel::DEBUG, message, component);
    }

    static void Info(const std::string& message, const std::string& component = "Transfer") {
        Log(LogLevel::INFO, message, component);
    }

    static void Warn(const std::string& message, const std::string& component = "Transfer") {
        Log(LogLevel::WARN, message, component);
    }

    static void Error(const std::string& message, const std::string& component = "Transfer") {
        Log(LogLevel::ERROR, message, component);
    }

    static void Fatal(const std::string& message, const std::string& component = "Transfer") {
        Log(LogLevel::FATAL, message, component);
    }

    static void SetLevel(LogLevel level) {
        min_level_.store(level, std::memory_order_relaxed);
    }

    // Accepts DEBUG/INFO/WARN/ERROR/FATAL; anything else maps to INFO.
    static LogLevel ParseLevel(const std::string& name);

private:
    static std::mutex mutex_;
    static std::atomic<LogLevel> min_level_;

    static std::string LevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_utc{};
        gmtime_r(&time_t_now, &tm_utc);

        std::stringstream ss;
        ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << "Z";
        return ss.str();
    }
};

#endif // LOGGER_HPP
