#pragma once
/**
 * @page ld2410-device LD2410 Device Client
 * @file device.hpp
 * @brief Request/reply correlation, configuration sessions and reports.
 *
 * @details
 * PURPOSE
 * -------
 * `Device` is the object applications talk to. It connects a transport,
 * serializes commands (one in flight per connection), matches each to the
 * reply carrying the same opcode, and exposes the latest radar report.
 *
 * REQUESTS
 * --------
 * send_request(opcode, payload, reply, err):
 *   - not connected: ConnectionClosed/"not_connected", nothing is written;
 *   - replies with another opcode are logged and skipped;
 *   - link lost while waiting: ConnectionClosed/"device_disconnected";
 *   - no reply before the configured timeout: Timeout;
 *   - non-zero status: CommandFailed with Error::status set.
 *
 * CONFIGURATION SESSIONS
 * ----------------------
 * The module only accepts configuration commands between config-enable
 * (0xFF) and config-disable (0xFE). A session is exclusive: a second
 * enter_configuration() waits for the first session to end. Three ways to
 * hold one:
 *   - enter_configuration() / exit_configuration() by hand, passing the
 *     SessionTicket the first one returned;
 *   - a ConfigSession token from configure(), closed by its destructor;
 *   - with_configuration(body, err), which runs @p body inside a session.
 *
 * Gated commands called outside a session fail with WrongContext before
 * anything is written. Exiting with a ticket that is no longer current
 * (the session already ended) does nothing.
 *
 * MODULE RESTART
 * --------------
 * A successful restart_module() leaves the session in Restarting: the
 * module is rebooting and already out of configuration mode, so the
 * session exit skips config-disable. With close_session=true the call
 * returns false with ModuleRestarted; with_configuration() absorbs that
 * signal (logged at INFO) unless the caller asks to see it.
 *
 * REPORTS
 * -------
 * The module streams reports while not configuring. get_last_report()
 * returns a copy of the newest one; wait_next_report() blocks for the next
 * and returns ReportWait::Closed once the link is gone. The timed variant
 * returns ReportWait::Timeout when nothing arrived in time.
 *
 * EXAMPLE
 * -------
 *   ld2410::DeviceConfig cfg;
 *   cfg.device = "/dev/ttyUSB0";
 *   ld2410::Device dev(cfg);
 *   ld2410::Error err;
 *   if (!dev.connect(err)) { ... }
 *   ld2410::FirmwareVersion fw;
 *   dev.with_configuration([&](const ld2410::ConfigModeStatus&, ld2410::Error& e) {
 *       return dev.get_firmware_version(fw, e);
 *   }, err);
 */

#include "ld2410/commands.hpp"
#include "ld2410/config.hpp"
#include "ld2410/connection.hpp"
#include "ld2410/errors.hpp"
#include "ld2410/models.hpp"
#include "ld2410/protocol.hpp"
#include "ld2410/report_channel.hpp"
#include "ld2410/session.hpp"
#include "ld2410/transport/transport_base.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ld2410 {

class Device;

/**
 * @brief Move-only token for an open configuration session.
 * Destroying (or close()-ing) an active token exits configuration mode.
 */
class ConfigSession {
public:
    ConfigSession() = default;
    ~ConfigSession() { close(); }

    ConfigSession(ConfigSession&& other) noexcept;
    ConfigSession& operator=(ConfigSession&& other) noexcept;
    ConfigSession(const ConfigSession&) = delete;
    ConfigSession& operator=(const ConfigSession&) = delete;

    bool active() const { return device_ != nullptr; }
    SessionTicket ticket() const { return ticket_; }
    const ConfigModeStatus& status() const { return status_; }

    void close();

private:
    friend class Device;
    Device* device_{nullptr};
    SessionTicket ticket_{NO_SESSION};
    ConfigModeStatus status_{};
};

class Device {
public:
    using ConfigBody = std::function<bool(const ConfigModeStatus&, Error&)>;

    explicit Device(DeviceConfig cfg = {});
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    const DeviceConfig& config() const { return cfg_; }
    void set_command_timeout(std::optional<std::chrono::milliseconds> timeout);

    // ---- link ----
    bool connect(Error& err);
    bool connect(std::unique_ptr<transport::ITransport> link, Error& err);
    void disconnect();

    bool connected() const;
    bool entered() const;
    bool configuring() const;
    SessionState session_state() const { return session_.state(); }

    // ---- requests ----
    bool send_request(uint8_t opcode, const std::vector<uint8_t>& payload,
                      Reply& out, Error& err);

    // ---- configuration sessions ----
    bool enter_configuration(ConfigModeStatus& out, SessionTicket& ticket, Error& err);
    void exit_configuration(SessionTicket ticket);
    bool configure(ConfigSession& session, Error& err);
    bool with_configuration(const ConfigBody& body, Error& err, bool surface_restart = false);

    // ---- configuration commands (session required) ----
    bool set_engineering_mode(bool enabled, Error& err);
    bool get_firmware_version(FirmwareVersion& out, Error& err);
    bool set_baud_rate(uint32_t baud, Error& err);
    bool reset_to_factory(Error& err);
    bool restart_module(bool close_session, Error& err);
    bool set_bluetooth_mode(bool enabled, Error& err);
    bool get_bluetooth_address(BluetoothAddress& out, Error& err);
    bool set_bluetooth_password(const std::string& password, Error& err);
    bool set_distance_resolution(uint16_t cm, Error& err);
    bool get_distance_resolution(uint16_t& cm, Error& err);

    // ---- reports ----
    std::optional<ReportStatus> get_last_report() const;
    ReportWait wait_next_report(ReportStatus& out);
    ReportWait wait_next_report_for(std::chrono::milliseconds timeout, ReportStatus& out);

private:
    std::shared_ptr<Connection> connection() const;
    bool require_configuring(uint8_t opcode, Error& err) const;
    bool config_request(CommandCode code, const std::vector<uint8_t>& payload,
                        Reply& out, Error& err);

    DeviceConfig cfg_;

    mutable std::mutex conn_mtx_;
    std::shared_ptr<Connection> conn_;

    std::mutex request_mtx_;      // one request in flight
    mutable std::mutex timeout_mtx_;
    SessionGate session_;
    ReportChannel reports_;
};

} // namespace ld2410
