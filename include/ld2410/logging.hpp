#pragma once
/**
 * @file logging.hpp
 * @brief Process-wide leveled logger (printf-style, stderr by default).
 *
 * Lines look like `2026-03-01 12:00:00 [WARN] Skipping 3 garbage bytes: 0a0b0c`.
 * A sink can replace the stderr writer; tests use it to capture records and
 * embedding programs use it to forward into their own logging.
 */

#include <atomic>
#include <cstdarg>
#include <functional>
#include <mutex>
#include <string>

namespace ld2410 {

enum class LogLevel { TRACE = 0, DEBUG, INFO, WARN, ERROR, OFF };

const char* level_name(LogLevel lvl);

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }

    /// Replace the output. An empty sink restores the stderr writer.
    void set_sink(Sink sink);

    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    Logger() = default;
    void write(LogLevel lvl, const std::string& msg);

    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    Sink sink_;
};

} // namespace ld2410
