#ifndef REPLAY_BRIDGE_LOGGER_HPP
#define REPLAY_BRIDGE_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>
#include <sstream>
#include <mutex>

enum class LogLevel {
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
private:
    static std::atomic<LogLevel> currentLevel;
    static std::atomic<bool> colorEnabled;
    static std::mutex outputMutex;  // gdb reader, replay drain and console threads all log

    static const char* getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR:   return "ERROR";
            case LogLevel::WARNING: return "WARN ";
            case LogLevel::INFO:    return "INFO ";
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::TRACE:   return "TRACE";
            default:                return "?????";
        }
    }

    static const char* getColorCode(LogLevel level) {
        if (!colorEnabled) return "";
        switch (level) {
            case LogLevel::ERROR:   return "\033[31m";  // Red
            case LogLevel::WARNING: return "\033[33m";  // Yellow
            case LogLevel::INFO:    return "\033[32m";  // Green
            case LogLevel::DEBUG:   return "\033[36m";  // Cyan
            case LogLevel::TRACE:   return "\033[90m";  // Gray
            default:                return "";
        }
    }

    static const char* getResetCode() {
        return colorEnabled ? "\033[0m" : "";
    }

    // HH:MM:SS.mmm local time
    static void writeTimestamp(std::ostream& out) {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);
        out << std::put_time(&local, "%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
    }

public:
    static void setLevel(LogLevel level) {
        currentLevel = level;
    }

    static bool isEnabled(LogLevel level) {
        return level <= currentLevel.load();
    }

    static void setColorEnabled(bool enabled) {
        colorEnabled = enabled;
    }

    // Unknown names fall back to INFO and return false
    static bool setLevelFromString(const std::string& levelStr) {
        std::string upper = levelStr;
        for (auto& c : upper) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));

        if (upper == "ERROR" || upper == "0") {
            currentLevel = LogLevel::ERROR;
        } else if (upper == "WARNING" || upper == "WARN" || upper == "1") {
            currentLevel = LogLevel::WARNING;
        } else if (upper == "INFO" || upper == "2") {
            currentLevel = LogLevel::INFO;
        } else if (upper == "DEBUG" || upper == "3") {
            currentLevel = LogLevel::DEBUG;
        } else if (upper == "TRACE" || upper == "4") {
            currentLevel = LogLevel::TRACE;
        } else {
            currentLevel = LogLevel::INFO;
            return false;
        }
        return true;
    }

    template<typename... Args>
    static void log(LogLevel level, Args... args) {
        if (!isEnabled(level)) return;
        write(level, args...);
    }

    // Writes regardless of the current level, labelled with the given one
    template<typename... Args>
    static void write(LogLevel level, Args... args) {
        std::ostringstream oss;
        ((oss << args), ...);

        std::lock_guard<std::mutex> lock(outputMutex);
        std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
        writeTimestamp(out);
        out << " " << getColorCode(level) << "[" << getLevelString(level) << "] " << getResetCode()
            << oss.str() << std::endl;
    }

    template<typename... Args>
    static void error(Args... args) {
        log(LogLevel::ERROR, args...);
    }

    template<typename... Args>
    static void warning(Args... args) {
        log(LogLevel::WARNING, args...);
    }

    template<typename... Args>
    static void info(Args... args) {
        log(LogLevel::INFO, args...);
    }

    template<typename... Args>
    static void debug(Args... args) {
        log(LogLevel::DEBUG, args...);
    }

    template<typename... Args>
    static void trace(Args... args) {
        log(LogLevel::TRACE, args...);
    }
};

#define LOG_ERROR(...) Logger::error(__VA_ARGS__)
#define LOG_WARNING(...) Logger::warning(__VA_ARGS__)
#define LOG_INFO(...) Logger::info(__VA_ARGS__)
#define LOG_DEBUG(...) Logger::debug(__VA_ARGS__)
#define LOG_TRACE(...) Logger::trace(__VA_ARGS__)

#endif // REPLAY_BRIDGE_LOGGER_HPP
