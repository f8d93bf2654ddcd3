#pragma once
/**
 * @file reply_slot.hpp
 * @brief Single-slot mailbox between the frame pump and the pending request.
 *
 * Holds at most one reply; a newer reply replaces an unread one. close()
 * plants the disconnect sentinel: once closed, waiters get Closed as soon
 * as any pending reply has been taken.
 */

#include "ld2410/protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace ld2410 {

class ReplySlot {
public:
    using Clock    = std::chrono::steady_clock;
    using Deadline = std::optional<Clock::time_point>;

    enum class WaitResult : uint8_t { Reply, Closed, Timeout };

    void put(Reply reply);
    void close();

    /// Drop an unread reply (the closed flag stays).
    void discard();

    /// Block until a reply, the sentinel, or @p deadline (none = forever).
    WaitResult wait(Reply& out, const Deadline& deadline);

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<Reply> pending_;
    bool closed_{false};
};

} // namespace ld2410
