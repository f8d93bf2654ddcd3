#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every fallible LD2410 operation.
 *
 * @details
 * Operations return `bool` and fill an `Error` on failure, the same way the
 * CLI helpers report `err="bad_value:..."`. The code is for programs, the
 * reason string is for people and scripts (stable, no spaces):
 *
 *   code              | typical reason
 *   ------------------|-----------------------------------------------
 *   ConnectionClosed  | not_connected, device_disconnected, write_failed
 *   Timeout           | timeout
 *   CommandFailed     | command_failed:0xa1 (status in Error::status)
 *   WrongContext      | not_configuring:0xa0
 *   BadParameter      | bad_value:baud_rate, bad_value:bt_password
 *   BadReply          | bad_reply:distance_resolution, short_payload
 *   ModuleRestarted   | module_restarted
 *   AlreadyConnected  | already_connected
 *   OpenFailed        | open_failed:<errno text>, no_device
 *
 * ModuleRestarted is a control-flow signal rather than a failure: it tells
 * the enclosing configuration scope that the device dropped out of
 * configuration mode on its own.
 */

#include <cstdint>
#include <string>

namespace ld2410 {

enum class ErrorCode : uint8_t {
    None = 0,
    ConnectionClosed,
    Timeout,
    CommandFailed,
    WrongContext,
    BadParameter,
    BadReply,
    ModuleRestarted,
    AlreadyConnected,
    OpenFailed
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "none";
        case ErrorCode::ConnectionClosed: return "connection_closed";
        case ErrorCode::Timeout:          return "timeout";
        case ErrorCode::CommandFailed:    return "command_failed";
        case ErrorCode::WrongContext:     return "wrong_context";
        case ErrorCode::BadParameter:     return "bad_parameter";
        case ErrorCode::BadReply:         return "bad_reply";
        case ErrorCode::ModuleRestarted:  return "module_restarted";
        case ErrorCode::AlreadyConnected: return "already_connected";
        case ErrorCode::OpenFailed:       return "open_failed";
    }
    return "unknown";
}

struct Error {
    ErrorCode   code{ErrorCode::None};
    uint8_t     opcode{0};    ///< command involved, 0 when not applicable
    uint16_t    status{0};    ///< device status word for CommandFailed
    std::string reason;

    bool ok() const { return code == ErrorCode::None; }

    void clear() {
        code = ErrorCode::None;
        opcode = 0;
        status = 0;
        reason.clear();
    }

    void set(ErrorCode c, std::string why, uint8_t op = 0, uint16_t st = 0) {
        code = c;
        reason = std::move(why);
        opcode = op;
        status = st;
    }
};

/// Fill @p err and return false, for one-line early exits.
inline bool fail(Error& err, ErrorCode code, std::string reason,
                 uint8_t opcode = 0, uint16_t status = 0) {
    err.set(code, std::move(reason), opcode, status);
    return false;
}

} // namespace ld2410
