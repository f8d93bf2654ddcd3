#pragma once
/**
 * @page ld2410-connection Connection and Frame Pump
 * @file connection.hpp
 * @brief One open link to the module plus the thread that reads it.
 *
 * @details
 * WHAT THIS DOES
 * --------------
 * - Owns the transport and a background pump thread.
 * - The pump reads chunks, feeds the FrameStream and dispatches each frame:
 *     * command-class frames are decoded as replies and placed in the
 *       ReplySlot (the newest replaces an unread one);
 *     * report-class frames are decoded and recorded on the ReportChannel.
 * - A frame that decodes but cannot be interpreted is logged as
 *   "Unable to handle frame: <hex>" and dropped; the pump keeps going.
 * - When the transport reports EOF, hangup or an error, the pump marks the
 *   connection down, closes the reply slot (disconnect sentinel) and closes
 *   the report channel so nobody waits on a dead link.
 *
 * LIFETIME
 * --------
 * A Connection is used once. stop() halts and joins the pump, then closes
 * the transport; reconnecting means building a new Connection.
 */

#include "ld2410/frame_stream.hpp"
#include "ld2410/reply_slot.hpp"
#include "ld2410/report_channel.hpp"
#include "ld2410/transport/transport_base.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ld2410 {

class Connection {
public:
    Connection(std::unique_ptr<transport::ITransport> link, ReportChannel& reports,
               std::size_t read_chunk, int poll_interval_ms);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start();
    void stop();

    bool connected() const { return connected_.load(); }

    /// Write one encoded frame. False when the link is down or the write fails.
    bool write(const std::vector<uint8_t>& bytes);

    ReplySlot& replies() { return replies_; }

    const char* transport_name() const;

private:
    void pump();
    void dispatch(const Frame& frame);
    void mark_down();

    std::unique_ptr<transport::ITransport> link_;
    ReportChannel& reports_;
    ReplySlot replies_;
    FrameStream stream_;

    std::size_t read_chunk_;
    int poll_interval_ms_;

    std::mutex io_mtx_;           // send() vs close()
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> down_{false};
};

} // namespace ld2410
