// -----------------------------------------------------------------------------
// reply_slot.cpp: implementation for reply_slot.hpp
// -----------------------------------------------------------------------------

#include "ld2410/reply_slot.hpp"

namespace ld2410 {

void ReplySlot::put(Reply reply) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pending_ = std::move(reply);
    }
    cv_.notify_all();
}

void ReplySlot::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

void ReplySlot::discard() {
    std::lock_guard<std::mutex> lk(mtx_);
    pending_.reset();
}

// ----- wait() -----
// A reply that arrived before the sentinel is still delivered.
ReplySlot::WaitResult ReplySlot::wait(Reply& out, const Deadline& deadline) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto ready = [this] { return pending_.has_value() || closed_; };

    if (deadline) {
        if (!cv_.wait_until(lk, *deadline, ready)) return WaitResult::Timeout;
    } else {
        cv_.wait(lk, ready);
    }

    if (pending_) {
        out = std::move(*pending_);
        pending_.reset();
        return WaitResult::Reply;
    }
    return WaitResult::Closed;
}

} // namespace ld2410
