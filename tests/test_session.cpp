#include <doctest/doctest.h>
#include "ld2410/session.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace ld2410;
using namespace std::chrono_literals;

TEST_CASE("Gate starts free and idle") {
    SessionGate gate;
    CHECK_FALSE(gate.held());
    CHECK(gate.current() == NO_SESSION);
    CHECK(gate.state() == SessionState::Idle);
}

TEST_CASE("Every acquire hands out a new ticket") {
    SessionGate gate;
    const SessionTicket first = gate.acquire();
    CHECK(first != NO_SESSION);
    CHECK(gate.holds(first));
    CHECK(gate.current() == first);
    gate.release(first);
    CHECK_FALSE(gate.holds(first));

    const SessionTicket second = gate.acquire();
    CHECK(second != first);
    CHECK(gate.holds(second));
    gate.release(second);
}

TEST_CASE("A stale ticket cannot release or change a newer holding") {
    SessionGate gate;
    const SessionTicket old_ticket = gate.acquire();
    gate.release(old_ticket);

    const SessionTicket current = gate.acquire();
    gate.set_state(current, SessionState::Configuring);

    gate.release(old_ticket);
    gate.set_state(old_ticket, SessionState::Restarting);
    gate.release(NO_SESSION);

    CHECK(gate.held());
    CHECK(gate.holds(current));
    CHECK(gate.state() == SessionState::Configuring);
    gate.release(current);
    CHECK_FALSE(gate.held());
}

TEST_CASE("A second acquire waits for release") {
    SessionGate gate;
    const SessionTicket t1 = gate.acquire();
    gate.set_state(t1, SessionState::Configuring);

    std::atomic<bool> second_in{false};
    std::thread t([&] {
        const SessionTicket t2 = gate.acquire();
        second_in = true;
        gate.release(t2);
    });

    std::this_thread::sleep_for(40ms);
    CHECK_FALSE(second_in.load());
    gate.release(t1);
    t.join();
    CHECK(second_in.load());
}

TEST_CASE("Release returns the gate to Idle") {
    SessionGate gate;
    const SessionTicket t = gate.acquire();
    gate.set_state(t, SessionState::Restarting);
    CHECK(gate.state() == SessionState::Restarting);
    gate.release(t);
    CHECK(gate.state() == SessionState::Idle);

    gate.set_state(t, SessionState::Configuring);
    CHECK(gate.state() == SessionState::Idle);
    gate.release(t);   // no-op
    CHECK_FALSE(gate.held());
}

TEST_CASE("State names") {
    CHECK(std::string(to_string(SessionState::Idle)) == "idle");
    CHECK(std::string(to_string(SessionState::Configuring)) == "configuring");
    CHECK(std::string(to_string(SessionState::Restarting)) == "restarting");
}
