#pragma once
/**
 * @file emulated_device.hpp
 * @brief In-process LD2410 stand-in for end-to-end tests.
 *
 * The emulator owns one end of a socketpair and answers command frames on a
 * background thread; the other end goes to the Device under test through an
 * FdTransport. Knobs let a test delay, drop, fail or corrupt replies, inject
 * raw bytes and reports, or hang up the link.
 */

#include "ld2410/frame_stream.hpp"
#include "ld2410/models.hpp"
#include "ld2410/transport/transport_fd.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ld2410::testing {

class EmulatedDevice {
public:
    using Clock = std::chrono::steady_clock;

    EmulatedDevice();
    ~EmulatedDevice();

    EmulatedDevice(const EmulatedDevice&) = delete;
    EmulatedDevice& operator=(const EmulatedDevice&) = delete;

    /// Host side of the link; call once, before start().
    std::unique_ptr<transport::FdTransport> host_transport();

    void start();
    void stop();

    // ---- behaviour knobs ----
    void set_reply_delay(std::chrono::milliseconds delay);
    void set_muted(bool muted);
    void fail_opcode(uint8_t opcode, uint16_t status);
    void send_spurious_reply_first(uint8_t opcode);
    void disconnect_after_next_command();
    void set_raw_resolution_index(uint16_t index);

    // ---- injection ----
    void send_raw(const std::vector<uint8_t>& bytes);
    void send_report(const ReportStatus& report);
    void close_link();

    // ---- observation ----
    bool config_mode() const;
    bool engineering() const;
    bool bluetooth() const;
    uint16_t baud_index() const;
    uint16_t resolution_index() const;
    std::string password() const;
    unsigned restarts() const;
    unsigned overlaps() const;
    std::vector<uint8_t> received_opcodes() const;
    std::size_t count_of(uint8_t opcode) const;

    /// Block until @p n commands arrived in total, or @p timeout.
    bool wait_for_commands(std::size_t n, std::chrono::milliseconds timeout) const;

private:
    struct Outgoing {
        Clock::time_point due;
        std::vector<uint8_t> bytes;
    };

    void run();
    void handle(const std::vector<uint8_t>& body);
    uint16_t answer(uint8_t opcode, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out);
    void queue_reply(uint8_t opcode, uint16_t status, const std::vector<uint8_t>& payload);
    void flush_due();
    void write_bytes(const std::vector<uint8_t>& bytes);
    void reset_state();

    int host_fd_{-1};
    int dev_fd_{-1};
    std::mutex write_mtx_;

    std::thread thread_;
    std::atomic<bool> running_{false};

    FrameStream stream_;
    std::deque<Outgoing> outgoing_;

    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;

    // knobs
    std::chrono::milliseconds reply_delay_{0};
    bool muted_{false};
    std::map<uint8_t, uint16_t> failures_;
    int spurious_opcode_{-1};
    bool hangup_after_next_{false};

    // module state
    bool config_mode_{false};
    bool engineering_{false};
    bool bluetooth_{true};
    uint16_t baud_index_{7};
    uint16_t resolution_index_{0};
    std::string password_{"HiLink"};
    unsigned restarts_{0};
    unsigned overlaps_{0};
    std::vector<uint8_t> received_;
};

} // namespace ld2410::testing
