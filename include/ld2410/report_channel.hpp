#pragma once
/**
 * @file report_channel.hpp
 * @brief Latest-value broadcast of decoded reports.
 *
 * @details
 * The frame pump records every report it decodes. Readers either copy the
 * latest one (get_latest, never blocks) or wait for the next one
 * (wait_next, any number of waiters, all woken by the same report). There
 * is no history: a slow reader only ever sees the newest report.
 *
 * Waits return Report, Timeout (only the timed variant) or Closed. close()
 * releases every waiter with Closed and makes later waits return it
 * immediately; open() re-arms the channel for a new connection. The last
 * report survives both.
 */

#include "ld2410/models.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace ld2410 {

enum class ReportWait : uint8_t { Report, Timeout, Closed };

class ReportChannel {
public:
    void record(const ReportStatus& report);

    std::optional<ReportStatus> get_latest() const;

    /// Block until the next report, or Closed when the channel closes first.
    ReportWait wait_next(ReportStatus& out);

    /// As wait_next(), or Timeout once @p timeout elapses.
    ReportWait wait_next_for(std::chrono::milliseconds timeout, ReportStatus& out);

    void open();
    void close();

    /// Number of reports recorded so far.
    uint64_t version() const;

private:
    ReportWait wait_impl(const std::optional<std::chrono::steady_clock::time_point>& deadline,
                   ReportStatus& out);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<ReportStatus> latest_;
    uint64_t version_{0};
    uint64_t epoch_{0};   // bumped by close()
    bool closed_{true};
};

} // namespace ld2410
