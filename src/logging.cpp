// -----------------------------------------------------------------------------
// logging.cpp: implementation for logging.hpp
// -----------------------------------------------------------------------------

#include "ld2410/logging.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>

namespace ld2410 {

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "OFF";
    }
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lk(mtx_);
    sink_ = std::move(sink);
}

// ----- log() -----
// Format once into a heap buffer sized by a first vsnprintf pass, then hand
// the finished line to write() under the lock.
void Logger::log(LogLevel lvl, const char* fmt, ...) {
    if (lvl == LogLevel::OFF || !enabled(lvl)) return;

    va_list ap;
    va_start(ap, fmt);
    va_list ap2;
    va_copy(ap2, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, ap);
    va_end(ap);

    std::string msg;
    if (n > 0) {
        std::vector<char> buf(static_cast<std::size_t>(n) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap2);
        msg.assign(buf.data(), static_cast<std::size_t>(n));
    }
    va_end(ap2);

    write(lvl, msg);
}

void Logger::write(LogLevel lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (sink_) {
        sink_(lvl, msg);
        return;
    }
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
    std::fprintf(stderr, "%s [%s] %s\n", ts, level_name(lvl), msg.c_str());
}

} // namespace ld2410
