// -----------------------------------------------------------------------------
// commands.cpp: implementation for commands.hpp
// -----------------------------------------------------------------------------

#include "ld2410/commands.hpp"   // builders, decoders and their validation rules
#include "ld2410/bytes.hpp"      // put_le16 / get_le16 and friends
#include "ld2410/protocol.hpp"   // CommandCode for error opcodes

#include <cstdio>                // std::snprintf for format_address

namespace ld2410 {

// ============================================================================
// Lookup tables
// ============================================================================
// Index order is what the module expects on the wire (index 0 is unused for
// baud rates).
static const uint32_t kBaudRates[] = {
    0, 9600, 19200, 38400, 57600, 115200, 230400, 256000, 460800
};

static const uint16_t kResolutions[] = { 75, 20 };   // cm per gate

// ----- baud_rate_to_index() / index_to_baud_rate() -----
bool baud_rate_to_index(uint32_t baud, uint16_t& index) {
    for (uint16_t i = 1; i < sizeof(kBaudRates) / sizeof(kBaudRates[0]); ++i) {
        if (kBaudRates[i] == baud) { index = i; return true; }
    }
    return false;
}

bool index_to_baud_rate(uint16_t index, uint32_t& baud) {
    if (index == 0 || index >= sizeof(kBaudRates) / sizeof(kBaudRates[0])) return false;
    baud = kBaudRates[index];
    return true;
}

// ----- resolution_to_index() / index_to_resolution() -----
bool resolution_to_index(uint16_t cm, uint16_t& index) {
    for (uint16_t i = 0; i < sizeof(kResolutions) / sizeof(kResolutions[0]); ++i) {
        if (kResolutions[i] == cm) { index = i; return true; }
    }
    return false;
}

bool index_to_resolution(uint16_t index, uint16_t& cm) {
    if (index >= sizeof(kResolutions) / sizeof(kResolutions[0])) return false;
    cm = kResolutions[index];
    return true;
}

// ============================================================================
// Request payloads
// ============================================================================

std::vector<uint8_t> make_config_enable() {
    std::vector<uint8_t> b;
    put_le16(b, 0x0001);
    return b;
}

std::vector<uint8_t> make_get_bluetooth_address() {
    std::vector<uint8_t> b;
    put_le16(b, 0x0001);
    return b;
}

// ---------------------------------------------------------------------------
// make_set_baud_rate()
// Only rates from kBaudRates are encoded; the new rate applies after the
// module restarts.
// ---------------------------------------------------------------------------
bool make_set_baud_rate(uint32_t baud, std::vector<uint8_t>& out, Error& err) {
    uint16_t index = 0;
    if (!baud_rate_to_index(baud, index)) {
        return fail(err, ErrorCode::BadParameter, "bad_value:baud_rate",
                    opcode_of(CommandCode::BaudRateSet));
    }
    out.clear();
    put_le16(out, index);
    return true;
}

std::vector<uint8_t> make_set_bluetooth_mode(bool enabled) {
    std::vector<uint8_t> b;
    put_le16(b, enabled ? 0x0001 : 0x0000);
    return b;
}

// ---------------------------------------------------------------------------
// make_set_bluetooth_password()
// Six bytes on the wire, shorter passwords are NUL padded.
// ---------------------------------------------------------------------------
bool make_set_bluetooth_password(const std::string& password, std::vector<uint8_t>& out, Error& err) {
    const uint8_t op = opcode_of(CommandCode::BluetoothPasswordSet);
    if (password.size() > BT_PASSWORD_MAX)
        return fail(err, ErrorCode::BadParameter, "bad_value:bt_password", op);
    for (char c : password) {
        if (static_cast<unsigned char>(c) > 0x7F)
            return fail(err, ErrorCode::BadParameter, "bad_value:bt_password", op);
    }

    BluetoothPassword pw(password.c_str());
    out.assign(BT_PASSWORD_MAX, 0x00);
    for (std::size_t i = 0; i < pw.size(); ++i) out[i] = static_cast<uint8_t>(pw[i]);
    return true;
}

bool make_set_distance_resolution(uint16_t cm, std::vector<uint8_t>& out, Error& err) {
    uint16_t index = 0;
    if (!resolution_to_index(cm, index)) {
        return fail(err, ErrorCode::BadParameter, "bad_value:distance_resolution",
                    opcode_of(CommandCode::DistanceResolutionSet));
    }
    out.clear();
    put_le16(out, index);
    return true;
}

// ============================================================================
// Reply payloads
// ============================================================================

bool decode_config_mode(const std::vector<uint8_t>& payload, ConfigModeStatus& out, Error& err) {
    if (payload.size() < 4)
        return fail(err, ErrorCode::BadReply, "short_payload", opcode_of(CommandCode::ConfigEnable));
    out.protocol_version = get_le16(payload.data());
    out.buffer_size      = get_le16(payload.data() + 2);
    return true;
}

// ---------------------------------------------------------------------------
// decode_firmware_version()
// Layout: type BE16, minor u8, major u8, revision LE32.
// ---------------------------------------------------------------------------
bool decode_firmware_version(const std::vector<uint8_t>& payload, FirmwareVersion& out, Error& err) {
    if (payload.size() < 8)
        return fail(err, ErrorCode::BadReply, "short_payload", opcode_of(CommandCode::FirmwareVersion));
    const uint8_t* p = payload.data();
    out.type     = get_be16(p);
    out.minor    = p[2];
    out.major    = p[3];
    out.revision = get_le32(p + 4);
    return true;
}

bool decode_bluetooth_address(const std::vector<uint8_t>& payload, BluetoothAddress& out, Error& err) {
    if (payload.size() < out.size())
        return fail(err, ErrorCode::BadReply, "short_payload", opcode_of(CommandCode::BluetoothMacGet));
    for (std::size_t i = 0; i < out.size(); ++i) out[i] = payload[i];
    return true;
}

bool decode_distance_resolution(const std::vector<uint8_t>& payload, uint16_t& cm, Error& err) {
    const uint8_t op = opcode_of(CommandCode::DistanceResolutionGet);
    if (payload.size() < 2)
        return fail(err, ErrorCode::BadReply, "short_payload", op);
    if (!index_to_resolution(get_le16(payload.data()), cm))
        return fail(err, ErrorCode::BadReply, "bad_reply:distance_resolution", op);
    return true;
}

std::vector<uint8_t> encode_config_mode(const ConfigModeStatus& s) {
    std::vector<uint8_t> b;
    put_le16(b, s.protocol_version);
    put_le16(b, s.buffer_size);
    return b;
}

std::vector<uint8_t> encode_firmware_version(const FirmwareVersion& v) {
    std::vector<uint8_t> b;
    b.push_back(static_cast<uint8_t>(v.type >> 8));   // big-endian type word
    b.push_back(static_cast<uint8_t>(v.type & 0xFF));
    b.push_back(v.minor);
    b.push_back(v.major);
    put_le32(b, v.revision);
    return b;
}

// ----- format_address() -----
std::string format_address(const BluetoothAddress& addr) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
    return buf;
}

} // namespace ld2410
