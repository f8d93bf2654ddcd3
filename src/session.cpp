// -----------------------------------------------------------------------------
// session.cpp: implementation for session.hpp
// -----------------------------------------------------------------------------

#include "ld2410/session.hpp"

namespace ld2410 {

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Idle:        return "idle";
        case SessionState::Configuring: return "configuring";
        case SessionState::Restarting:  return "restarting";
    }
    return "unknown";
}

// ----- acquire() -----
SessionTicket SessionGate::acquire() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !held_; });
    held_   = true;
    state_  = SessionState::Idle;
    ticket_ = ++last_issued_;
    return ticket_;
}

// ----- release() -----
void SessionGate::release(SessionTicket ticket) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!held_ || ticket == NO_SESSION || ticket != ticket_) return;
        held_   = false;
        ticket_ = NO_SESSION;
        state_  = SessionState::Idle;
    }
    cv_.notify_one();
}

bool SessionGate::held() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return held_;
}

bool SessionGate::holds(SessionTicket ticket) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return held_ && ticket != NO_SESSION && ticket == ticket_;
}

SessionTicket SessionGate::current() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ticket_;
}

SessionState SessionGate::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

void SessionGate::set_state(SessionTicket ticket, SessionState s) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (held_ && ticket != NO_SESSION && ticket == ticket_) state_ = s;
}

} // namespace ld2410
