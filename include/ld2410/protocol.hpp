#pragma once
/**
 * @page ld2410-protocol LD2410 Body Envelopes
 * @file protocol.hpp
 * @brief Command/reply/report bodies carried inside frames.
 *
 * @details
 * BODY LAYOUTS
 * ------------
 *   command request : [opcode][0x00][payload...]
 *   command reply   : [opcode][0x01][status:LE16][payload...]   payload only when status == 0
 *   report          : [type][0xAA][data...][0x55][0x00]
 *
 * The engine treats payloads as opaque bytes keyed by opcode. The command
 * catalog below records what is known about each opcode so the dispatch
 * path can drop replies whose payload cannot be right; opcodes missing from
 * the catalog pass through untouched.
 *
 * REPORT DATA
 * -----------
 *   basic (9 bytes):
 *     target_status u8, motion_distance LE16, motion_energy u8,
 *     standstill_distance LE16, standstill_energy u8, detection_distance LE16
 *   engineering (basic + 22 bytes):
 *     motion_max_gate u8, standstill_max_gate u8,
 *     motion energy[9], standstill energy[9], photosensitive u8, out_pin u8
 */

#include "ld2410/models.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ld2410 {

enum class CommandCode : uint8_t {
    ParametersWrite        = 0x60,
    ParametersRead         = 0x61,
    EngineeringEnable      = 0x62,
    EngineeringDisable     = 0x63,
    GateSensitivitySet     = 0x64,
    FirmwareVersion        = 0xA0,
    BaudRateSet            = 0xA1,
    FactoryReset           = 0xA2,
    ModuleRestart          = 0xA3,
    BluetoothSet           = 0xA4,
    BluetoothMacGet        = 0xA5,
    BluetoothAuthenticate  = 0xA8,
    BluetoothPasswordSet   = 0xA9,
    DistanceResolutionSet  = 0xAA,
    DistanceResolutionGet  = 0xAB,
    AuxSet                 = 0xAD,
    AuxGet                 = 0xAE,
    ConfigDisable          = 0xFE,
    ConfigEnable           = 0xFF
};

constexpr uint8_t opcode_of(CommandCode c) { return static_cast<uint8_t>(c); }

constexpr uint8_t REQUEST_MARKER     = 0x00;
constexpr uint8_t REPLY_MARKER       = 0x01;
constexpr uint8_t REPORT_HEAD        = 0xAA;
constexpr uint8_t REPORT_TAIL        = 0x55;
constexpr uint8_t REPORT_CALIBRATION = 0x00;

constexpr std::size_t REPORT_BASIC_SIZE       = 9;
constexpr std::size_t REPORT_ENGINEERING_SIZE = 22;

/// Catalog entry. reply_size < 0 means the success payload is not checked.
struct CommandSpec {
    uint8_t     opcode;
    const char* name;
    bool        requires_config;
    int         reply_size;
};

/// nullptr for opcodes outside the catalog.
const CommandSpec* find_command(uint8_t opcode);

/// Catalog name, or "0xNN" for unknown opcodes.
std::string command_name(uint8_t opcode);

/// A decoded command reply.
struct Reply {
    uint8_t              opcode{0};
    uint16_t             status{0};
    std::vector<uint8_t> payload;

    bool ok() const { return status == 0; }
};

/// [opcode][0x00][payload]
std::vector<uint8_t> build_command_body(uint8_t opcode, const std::vector<uint8_t>& payload);

/// Split a command request body (used by the device side of tests).
bool parse_command_body(const std::vector<uint8_t>& body, uint8_t& opcode,
                        std::vector<uint8_t>& payload, std::string& err);

/// [opcode][0x01][status][payload if status == 0]
std::vector<uint8_t> build_reply_body(uint8_t opcode, uint16_t status,
                                      const std::vector<uint8_t>& payload);

/**
 * @brief Decode a reply body.
 * Errors: "short_reply", "not_a_reply:<marker>".
 */
bool parse_reply(const std::vector<uint8_t>& body, Reply& out, std::string& err);

/**
 * @brief Check a reply against the catalog.
 * A successful reply to a known opcode must carry exactly the documented
 * payload size. Error: "bad_reply_size:<name>".
 */
bool check_reply(const Reply& reply, std::string& err);

std::vector<uint8_t> build_report_body(const ReportStatus& report);

/**
 * @brief Decode a report body.
 * Errors: "short_report", "bad_report_type:<n>", "bad_report_head",
 * "bad_report_tail", "bad_report_size".
 */
bool parse_report(const std::vector<uint8_t>& body, ReportStatus& out, std::string& err);

} // namespace ld2410
