// -----------------------------------------------------------------------------
// connection.cpp: implementation for connection.hpp
// -----------------------------------------------------------------------------

#include "ld2410/connection.hpp"
#include "ld2410/bytes.hpp"
#include "ld2410/logging.hpp"
#include "ld2410/protocol.hpp"

namespace ld2410 {

Connection::Connection(std::unique_ptr<transport::ITransport> link, ReportChannel& reports,
                       std::size_t read_chunk, int poll_interval_ms)
    : link_(std::move(link)),
      reports_(reports),
      read_chunk_(read_chunk ? read_chunk : 2048),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 100) {}

Connection::~Connection() {
    stop();
}

const char* Connection::transport_name() const {
    return link_ ? link_->name() : "none";
}

// ----- start() -----
void Connection::start() {
    if (running_.load() || !link_ || !link_->is_open()) return;
    connected_.store(true);
    running_.store(true);
    thread_ = std::thread(&Connection::pump, this);
    Logger::instance().log(LogLevel::DEBUG, "Connection started on %s", link_->name());
}

// ----- stop() -----
// Join first, then close: the pump never sees a closed fd.
void Connection::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) thread_.detach();
        else                                                 thread_.join();
    }
    {
        std::lock_guard<std::mutex> lk(io_mtx_);
        if (link_) link_->close();
    }
    mark_down();
}

// Runs once per connection, whichever of pump() and stop() gets there first.
void Connection::mark_down() {
    connected_.store(false);
    if (down_.exchange(true)) return;
    replies_.close();
    reports_.close();
}

// ----- write() -----
bool Connection::write(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (!connected_.load() || !link_ || !link_->is_open()) return false;
    Logger::instance().log(LogLevel::TRACE, "TX %s", to_hex(bytes).c_str());
    return link_->send(bytes.data(), bytes.size()) == transport::TxResult::Ok;
}

// ----- pump() -----
void Connection::pump() {
    auto& log = Logger::instance();
    std::vector<uint8_t> chunk(read_chunk_);

    while (running_.load()) {
        std::size_t n = 0;
        const auto rc = link_->recv(chunk.data(), chunk.size(), n, poll_interval_ms_);

        if (rc == transport::RxResult::None) continue;
        if (rc == transport::RxResult::Closed) {
            log.log(LogLevel::INFO, "Transport %s closed by peer", link_->name());
            break;
        }
        if (rc == transport::RxResult::Error) {
            log.log(LogLevel::ERROR, "Transport %s read error", link_->name());
            break;
        }

        log.log(LogLevel::TRACE, "RX %s", to_hex(chunk.data(), n).c_str());
        stream_.push(chunk.data(), n);

        Frame frame;
        while (stream_.next(frame)) dispatch(frame);
    }

    mark_down();
}

// ----- dispatch() -----
void Connection::dispatch(const Frame& frame) {
    std::string why;

    if (frame.kind == FrameKind::Command) {
        Reply reply;
        if (!parse_reply(frame.body, reply, why) || !check_reply(reply, why)) {
            Logger::instance().log(LogLevel::WARN, "Unable to handle frame: %s (%s)",
                                   to_hex(frame.body).c_str(), why.c_str());
            return;
        }
        replies_.put(std::move(reply));
        return;
    }

    ReportStatus report;
    if (!parse_report(frame.body, report, why)) {
        Logger::instance().log(LogLevel::WARN, "Unable to handle frame: %s (%s)",
                               to_hex(frame.body).c_str(), why.c_str());
        return;
    }
    reports_.record(report);
}

} // namespace ld2410
