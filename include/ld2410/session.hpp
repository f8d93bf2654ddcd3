#pragma once
/**
 * @file session.hpp
 * @brief Configuration-session state and its single-holder gate.
 *
 * @details
 * STATES
 * ------
 *   Idle         no session, or a session being opened
 *   Configuring  config-enable succeeded, configuration commands allowed
 *   Restarting   a module restart was acknowledged; the device already left
 *                configuration mode so config-disable must not be sent
 *
 * The gate has exactly one holder at a time. It is not tied to a thread:
 * a session opened on one thread may be closed on another, which is what a
 * moved session token needs. Each acquire() hands out a fresh ticket;
 * release() and set_state() act only for the current ticket, so a stale
 * holder cannot end a newer session.
 */

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace ld2410 {

enum class SessionState : uint8_t { Idle = 0, Configuring, Restarting };

const char* to_string(SessionState s);

/// Identifies one holding of the gate. Never reused; 0 means none.
using SessionTicket = uint64_t;
constexpr SessionTicket NO_SESSION = 0;

class SessionGate {
public:
    /// Block until the gate is free, then hold it (state Idle).
    SessionTicket acquire();

    /// Give the gate up and return to Idle. No-op unless @p ticket is current.
    void release(SessionTicket ticket);

    bool held() const;
    bool holds(SessionTicket ticket) const;

    /// Ticket of the current holder, NO_SESSION when free.
    SessionTicket current() const;

    SessionState state() const;

    /// No-op unless @p ticket is current.
    void set_state(SessionTicket ticket, SessionState s);

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool held_{false};
    SessionTicket ticket_{NO_SESSION};
    SessionTicket last_issued_{NO_SESSION};
    SessionState state_{SessionState::Idle};
};

} // namespace ld2410
