#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <ctime>

namespace Driftwatch {

/**
 * @brief Thread-safe console logger shared by monitors, dispatchers and the pipeline.
 *
 * Every line carries a UTC timestamp and an optional component tag:
 *   2026-10-19T08:00:00Z >>> [embedding] Fetched 1200 baseline vectors
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& component, const std::string& message) {
        static std::mutex mutex;

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::string stamp = utc_stamp();

        std::lock_guard<std::mutex> lock(mutex);
        std::ostream& out = (level == Level::Error || level == Level::Warning) ? std::cerr : std::cout;
        out << stamp << ' ' << color << prefix;
        if (!component.empty()) out << '[' << component << "] ";
        out << message << "\033[0m" << std::endl;
    }

    static void info(const std::string& msg)    { log(Level::Info, "", msg); }
    static void step(const std::string& msg)    { log(Level::Step, "", msg); }
    static void success(const std::string& msg) { log(Level::Success, "", msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, "", msg); }
    static void error(const std::string& msg)   { log(Level::Error, "", msg); }

    static void info(const std::string& component, const std::string& msg)    { log(Level::Info, component, msg); }
    static void step(const std::string& component, const std::string& msg)    { log(Level::Step, component, msg); }
    static void success(const std::string& component, const std::string& msg) { log(Level::Success, component, msg); }
    static void warn(const std::string& component, const std::string& msg)    { log(Level::Warning, component, msg); }
    static void error(const std::string& component, const std::string& msg)   { log(Level::Error, component, msg); }

private:
    static std::string utc_stamp() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        gmtime_r(&now, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }
};

} // namespace Driftwatch
