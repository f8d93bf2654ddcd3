// -----------------------------------------------------------------------------
// device.cpp: implementation for device.hpp
// -----------------------------------------------------------------------------

#include "ld2410/device.hpp"
#include "ld2410/frame.hpp"
#include "ld2410/logging.hpp"
#include "ld2410/transport/transport_linux_serial.hpp"

#include <cstdio>   // std::snprintf

namespace ld2410 {

static std::string opcode_reason(const char* prefix, uint8_t opcode) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s:0x%02x", prefix, opcode);
    return buf;
}

// ============================================================================
// ConfigSession
// ============================================================================

ConfigSession::ConfigSession(ConfigSession&& other) noexcept
    : device_(other.device_), ticket_(other.ticket_), status_(other.status_) {
    other.device_ = nullptr;
    other.ticket_ = NO_SESSION;
}

ConfigSession& ConfigSession::operator=(ConfigSession&& other) noexcept {
    if (this != &other) {
        close();
        device_ = other.device_;
        ticket_ = other.ticket_;
        status_ = other.status_;
        other.device_ = nullptr;
        other.ticket_ = NO_SESSION;
    }
    return *this;
}

void ConfigSession::close() {
    if (!device_) return;
    Device* dev = device_;
    const SessionTicket ticket = ticket_;
    device_ = nullptr;
    ticket_ = NO_SESSION;
    dev->exit_configuration(ticket);
}

// ============================================================================
// Device: link
// ============================================================================

Device::Device(DeviceConfig cfg) : cfg_(std::move(cfg)) {}

Device::~Device() {
    disconnect();
}

void Device::set_command_timeout(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lk(timeout_mtx_);
    cfg_.command_timeout = timeout;
}

std::shared_ptr<Connection> Device::connection() const {
    std::lock_guard<std::mutex> lk(conn_mtx_);
    return conn_;
}

// ----- connect() -----
// Opens the configured serial port.
bool Device::connect(Error& err) {
    if (entered()) return fail(err, ErrorCode::AlreadyConnected, "already_connected");
    if (cfg_.device.empty()) return fail(err, ErrorCode::OpenFailed, "no_device");

    auto serial = std::make_unique<transport::LinuxSerial>();
    std::string why;
    if (!serial->open({cfg_.device, cfg_.baudrate}, why)) {
        Logger::instance().log(LogLevel::ERROR, "Unable to open %s: %s",
                               cfg_.device.c_str(), why.c_str());
        return fail(err, ErrorCode::OpenFailed, why);
    }
    return connect(std::move(serial), err);
}

bool Device::connect(std::unique_ptr<transport::ITransport> link, Error& err) {
    if (!link || !link->is_open()) return fail(err, ErrorCode::OpenFailed, "transport_not_open");

    std::lock_guard<std::mutex> lk(conn_mtx_);
    if (conn_) return fail(err, ErrorCode::AlreadyConnected, "already_connected");

    reports_.open();
    conn_ = std::make_shared<Connection>(std::move(link), reports_,
                                         cfg_.read_chunk, cfg_.poll_interval_ms);
    conn_->start();
    Logger::instance().log(LogLevel::INFO, "Connected through %s", conn_->transport_name());
    err.clear();
    return true;
}

// ----- disconnect() -----
// Safe to call at any time, including after the module went away.
void Device::disconnect() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lk(conn_mtx_);
        conn.swap(conn_);
    }
    if (!conn) return;
    conn->stop();
    Logger::instance().log(LogLevel::INFO, "Disconnected");
}

bool Device::connected() const {
    auto conn = connection();
    return conn && conn->connected();
}

bool Device::entered() const {
    return connection() != nullptr;
}

bool Device::configuring() const {
    return session_.held() && session_.state() == SessionState::Configuring;
}

// ============================================================================
// Device: requests
// ============================================================================

// ----- send_request() -----
// The deadline covers the write and the wait for the matching reply.
bool Device::send_request(uint8_t opcode, const std::vector<uint8_t>& payload,
                          Reply& out, Error& err) {
    std::lock_guard<std::mutex> gate(request_mtx_);

    auto conn = connection();
    if (!conn || !conn->connected())
        return fail(err, ErrorCode::ConnectionClosed, "not_connected", opcode);

    ReplySlot::Deadline deadline;
    {
        std::lock_guard<std::mutex> lk(timeout_mtx_);
        if (cfg_.command_timeout) deadline = ReplySlot::Clock::now() + *cfg_.command_timeout;
    }

    std::vector<uint8_t> frame;
    std::string why;
    if (!encode_frame(FrameKind::Command, build_command_body(opcode, payload), frame, why))
        return fail(err, ErrorCode::BadParameter, why, opcode);

    auto& log = Logger::instance();
    log.log(LogLevel::DEBUG, "Sending %s", command_name(opcode).c_str());

    conn->replies().discard();
    if (!conn->write(frame))
        return fail(err, ErrorCode::ConnectionClosed, "write_failed", opcode);

    for (;;) {
        Reply reply;
        switch (conn->replies().wait(reply, deadline)) {
            case ReplySlot::WaitResult::Closed:
                return fail(err, ErrorCode::ConnectionClosed, "device_disconnected", opcode);

            case ReplySlot::WaitResult::Timeout:
                log.log(LogLevel::WARN, "No reply to %s in time", command_name(opcode).c_str());
                return fail(err, ErrorCode::Timeout, "timeout", opcode);

            case ReplySlot::WaitResult::Reply:
                break;
        }

        if (reply.opcode != opcode) {
            log.log(LogLevel::WARN, "Got reply opcode 0x%02x (request was 0x%02x)",
                    reply.opcode, opcode);
            continue;
        }
        if (!reply.ok()) {
            return fail(err, ErrorCode::CommandFailed,
                        opcode_reason("command_failed", opcode), opcode, reply.status);
        }
        out = std::move(reply);
        err.clear();
        return true;
    }
}

// ============================================================================
// Device: configuration sessions
// ============================================================================

// ----- enter_configuration() -----
bool Device::enter_configuration(ConfigModeStatus& out, SessionTicket& ticket, Error& err) {
    ticket = NO_SESSION;
    const SessionTicket held = session_.acquire();

    Reply reply;
    if (!send_request(opcode_of(CommandCode::ConfigEnable), make_config_enable(), reply, err)) {
        session_.release(held);
        return false;
    }
    if (!decode_config_mode(reply.payload, out, err)) {
        session_.release(held);
        return false;
    }

    session_.set_state(held, SessionState::Configuring);
    ticket = held;
    Logger::instance().log(LogLevel::DEBUG, "Configuration mode entered (protocol %u, buffer %u)",
                           out.protocol_version, out.buffer_size);
    return true;
}

// ----- exit_configuration() -----
// Never fails: a refused config-disable is logged, a restarted module or a
// lost link skips it. A ticket that is not the current holder does nothing.
void Device::exit_configuration(SessionTicket ticket) {
    if (!session_.holds(ticket)) return;

    auto& log = Logger::instance();
    const SessionState st = session_.state();

    if (st == SessionState::Configuring && connected()) {
        Reply reply;
        Error e;
        if (!send_request(opcode_of(CommandCode::ConfigDisable), {}, reply, e)) {
            if (e.code == ErrorCode::CommandFailed)
                log.log(LogLevel::WARN, "Device refused to leave configuration mode (status %u)",
                        e.status);
            else
                log.log(LogLevel::WARN, "Unable to leave configuration mode: %s", e.reason.c_str());
        }
    } else if (st == SessionState::Restarting) {
        log.log(LogLevel::DEBUG, "Module restarted, configuration mode already left");
    }

    session_.release(ticket);
}

// ----- configure() -----
bool Device::configure(ConfigSession& session, Error& err) {
    session.close();
    ConfigModeStatus status;
    SessionTicket ticket = NO_SESSION;
    if (!enter_configuration(status, ticket, err)) return false;
    session.device_ = this;
    session.ticket_ = ticket;
    session.status_ = status;
    return true;
}

// ----- with_configuration() -----
bool Device::with_configuration(const ConfigBody& body, Error& err, bool surface_restart) {
    ConfigModeStatus status;
    SessionTicket ticket = NO_SESSION;
    if (!enter_configuration(status, ticket, err)) return false;

    Error body_err;
    const bool ok = body ? body(status, body_err) : true;
    exit_configuration(ticket);

    if (ok) {
        err.clear();
        return true;
    }
    if (body_err.code == ErrorCode::ModuleRestarted && !surface_restart) {
        Logger::instance().log(LogLevel::INFO, "Module has restarted, configuration session closed");
        err.clear();
        return true;
    }
    err = body_err;
    return false;
}

// ============================================================================
// Device: configuration commands
// ============================================================================

bool Device::require_configuring(uint8_t opcode, Error& err) const {
    if (configuring()) return true;
    return fail(err, ErrorCode::WrongContext, opcode_reason("not_configuring", opcode), opcode);
}

bool Device::config_request(CommandCode code, const std::vector<uint8_t>& payload,
                            Reply& out, Error& err) {
    const uint8_t op = opcode_of(code);
    if (!require_configuring(op, err)) return false;
    return send_request(op, payload, out, err);
}

bool Device::set_engineering_mode(bool enabled, Error& err) {
    Reply reply;
    return config_request(enabled ? CommandCode::EngineeringEnable : CommandCode::EngineeringDisable,
                          {}, reply, err);
}

bool Device::get_firmware_version(FirmwareVersion& out, Error& err) {
    Reply reply;
    if (!config_request(CommandCode::FirmwareVersion, {}, reply, err)) return false;
    return decode_firmware_version(reply.payload, out, err);
}

bool Device::set_baud_rate(uint32_t baud, Error& err) {
    if (!require_configuring(opcode_of(CommandCode::BaudRateSet), err)) return false;
    std::vector<uint8_t> payload;
    if (!make_set_baud_rate(baud, payload, err)) return false;
    Reply reply;
    return config_request(CommandCode::BaudRateSet, payload, reply, err);
}

bool Device::reset_to_factory(Error& err) {
    Reply reply;
    return config_request(CommandCode::FactoryReset, {}, reply, err);
}

// ----- restart_module() -----
bool Device::restart_module(bool close_session, Error& err) {
    Reply reply;
    if (!config_request(CommandCode::ModuleRestart, {}, reply, err)) return false;

    session_.set_state(session_.current(), SessionState::Restarting);
    Logger::instance().log(LogLevel::DEBUG, "Module restart acknowledged");
    if (close_session)
        return fail(err, ErrorCode::ModuleRestarted, "module_restarted",
                    opcode_of(CommandCode::ModuleRestart));
    return true;
}

bool Device::set_bluetooth_mode(bool enabled, Error& err) {
    Reply reply;
    return config_request(CommandCode::BluetoothSet, make_set_bluetooth_mode(enabled), reply, err);
}

bool Device::get_bluetooth_address(BluetoothAddress& out, Error& err) {
    Reply reply;
    if (!config_request(CommandCode::BluetoothMacGet, make_get_bluetooth_address(), reply, err))
        return false;
    return decode_bluetooth_address(reply.payload, out, err);
}

bool Device::set_bluetooth_password(const std::string& password, Error& err) {
    if (!require_configuring(opcode_of(CommandCode::BluetoothPasswordSet), err)) return false;
    std::vector<uint8_t> payload;
    if (!make_set_bluetooth_password(password, payload, err)) return false;
    Reply reply;
    return config_request(CommandCode::BluetoothPasswordSet, payload, reply, err);
}

bool Device::set_distance_resolution(uint16_t cm, Error& err) {
    if (!require_configuring(opcode_of(CommandCode::DistanceResolutionSet), err)) return false;
    std::vector<uint8_t> payload;
    if (!make_set_distance_resolution(cm, payload, err)) return false;
    Reply reply;
    return config_request(CommandCode::DistanceResolutionSet, payload, reply, err);
}

bool Device::get_distance_resolution(uint16_t& cm, Error& err) {
    Reply reply;
    if (!config_request(CommandCode::DistanceResolutionGet, {}, reply, err)) return false;
    return decode_distance_resolution(reply.payload, cm, err);
}

// ============================================================================
// Device: reports
// ============================================================================

std::optional<ReportStatus> Device::get_last_report() const {
    return reports_.get_latest();
}

ReportWait Device::wait_next_report(ReportStatus& out) {
    return reports_.wait_next(out);
}

ReportWait Device::wait_next_report_for(std::chrono::milliseconds timeout, ReportStatus& out) {
    return reports_.wait_next_for(timeout, out);
}

} // namespace ld2410
