#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>
#include <mutex>
#include <unistd.h>

namespace ChainReplay {

/**
 * @brief Thread-safe console logger for the replay pipeline.
 *
 * Stateless apart from the output lock: there is no process-wide level switch.
 * Progress lines go through bulk(); everything else picks the level by intent.
 * Each line starts with a UTC timestamp. Color codes are written only when
 * the target stream is a terminal, so redirected import logs stay plain.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Bulk
    };

    static void log(Level level, const std::string& message) {
        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[BULK] "; break; // Magenta
        }

        const bool to_stderr = level == Level::Error || level == Level::Warning;
        std::ostream& out = to_stderr ? std::cerr : std::cout;
        static const bool stdout_tty = ::isatty(STDOUT_FILENO) != 0;
        static const bool stderr_tty = ::isatty(STDERR_FILENO) != 0;

        if (to_stderr ? stderr_tty : stdout_tty) {
            out << color << timestamp() << ' ' << prefix << message << "\033[0m" << std::endl;
        } else {
            out << timestamp() << ' ' << prefix << message << std::endl;
        }
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

private:
    // 2021-06-01T12:00:00Z
    static std::string timestamp() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm utc{};
        ::gmtime_r(&now, &utc);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buf;
    }
};

} // namespace ChainReplay
