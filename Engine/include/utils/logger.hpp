#pragma once

#include <utils/time.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <mutex>
#include <stdexcept>

namespace Instasave {

/**
 * @brief Thread-safe logging utility for the ingestion pipeline.
 *
 * Console output is coloured; an optional file sink receives the same lines
 * with a UTC time stamp and level name.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex());
        if (level < threshold()) return;

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;

        if (file().is_open()) {
            file() << utc_iso8601_now() << " " << level_name(level) << " " << message << "\n";
            file().flush();
        }
    }

    /**
     * @brief Parse a level name (DEBUG, INFO, WARNING, ERROR); unknown names map to Info.
     */
    static Level parse_level(const std::string& name) {
        if (name == "DEBUG" || name == "debug") return Level::Debug;
        if (name == "WARNING" || name == "warning" || name == "WARN") return Level::Warning;
        if (name == "ERROR" || name == "error" || name == "CRITICAL") return Level::Error;
        return Level::Info;
    }

    static void set_level(Level level) {
        std::lock_guard<std::mutex> lock(mutex());
        threshold() = level;
    }

    /**
     * @brief Append log lines to a file in addition to the console.
     * @throws std::runtime_error if the file cannot be opened
     */
    static void attach_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex());
        if (file().is_open()) file().close();
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
        file().open(path, std::ios::app);
        if (!file().is_open()) {
            throw std::runtime_error("Cannot open log file: " + path.string());
        }
    }

    static void detach_file() {
        std::lock_guard<std::mutex> lock(mutex());
        if (file().is_open()) file().close();
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static const char* level_name(Level level) {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO";
            case Level::Step:    return "INFO";
            case Level::Success: return "INFO";
            case Level::Warning: return "WARNING";
            case Level::Error:   return "ERROR";
        }
        return "INFO";
    }

    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static Level& threshold() {
        static Level level = Level::Info;
        return level;
    }

    static std::ofstream& file() {
        static std::ofstream f;
        return f;
    }
};

} // namespace Instasave
