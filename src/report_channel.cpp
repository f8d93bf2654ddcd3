// -----------------------------------------------------------------------------
// report_channel.cpp: implementation for report_channel.hpp
// -----------------------------------------------------------------------------

#include "ld2410/report_channel.hpp"

namespace ld2410 {

void ReportChannel::record(const ReportStatus& report) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        latest_ = report;
        ++version_;
    }
    cv_.notify_all();
}

std::optional<ReportStatus> ReportChannel::get_latest() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return latest_;
}

uint64_t ReportChannel::version() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return version_;
}

void ReportChannel::open() {
    std::lock_guard<std::mutex> lk(mtx_);
    closed_ = false;
}

void ReportChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
        ++epoch_;
    }
    cv_.notify_all();
}

ReportWait ReportChannel::wait_next(ReportStatus& out) {
    return wait_impl(std::nullopt, out);
}

ReportWait ReportChannel::wait_next_for(std::chrono::milliseconds timeout, ReportStatus& out) {
    return wait_impl(std::chrono::steady_clock::now() + timeout, out);
}

// ----- wait_impl() -----
// A waiter is satisfied by a newer version, released by a newer epoch.
ReportWait ReportChannel::wait_impl(const std::optional<std::chrono::steady_clock::time_point>& deadline,
                                    ReportStatus& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    if (closed_) return ReportWait::Closed;

    const uint64_t seen_version = version_;
    const uint64_t seen_epoch   = epoch_;
    auto changed = [&] { return version_ != seen_version || epoch_ != seen_epoch; };

    if (deadline) {
        if (!cv_.wait_until(lk, *deadline, changed)) return ReportWait::Timeout;
    } else {
        cv_.wait(lk, changed);
    }

    if (version_ == seen_version || !latest_) return ReportWait::Closed;
    out = *latest_;
    return ReportWait::Report;
}

} // namespace ld2410
