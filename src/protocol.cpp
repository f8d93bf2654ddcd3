// -----------------------------------------------------------------------------
// protocol.cpp: implementation for protocol.hpp
// -----------------------------------------------------------------------------

#include "ld2410/protocol.hpp"
#include "ld2410/bytes.hpp"

#include <cstdio>   // std::snprintf

namespace ld2410 {

// ============================================================================
// Command catalog
// ============================================================================
// Sizes are the success payload after the status word. Everything but
// config_enable needs an open configuration session on the device.
static const CommandSpec kCatalog[] = {
    { 0xFF, "config_enable",           false,  4 },
    { 0xFE, "config_disable",          true,   0 },
    { 0x60, "parameters_write",        true,   0 },
    { 0x61, "parameters_read",         true,  -1 },
    { 0x62, "engineering_enable",      true,   0 },
    { 0x63, "engineering_disable",     true,   0 },
    { 0x64, "gate_sensitivity_set",    true,   0 },
    { 0xA0, "firmware_version",        true,   8 },
    { 0xA1, "baud_rate_set",           true,   0 },
    { 0xA2, "factory_reset",           true,   0 },
    { 0xA3, "module_restart",          true,   0 },
    { 0xA4, "bluetooth_set",           true,   0 },
    { 0xA5, "bluetooth_mac_get",       true,   6 },
    { 0xA8, "bluetooth_authenticate",  true,   0 },
    { 0xA9, "bluetooth_password_set",  true,   0 },
    { 0xAA, "distance_resolution_set", true,   0 },
    { 0xAB, "distance_resolution_get", true,   2 },
    { 0xAD, "aux_set",                 true,   0 },
    { 0xAE, "aux_get",                 true,  -1 },
};

const CommandSpec* find_command(uint8_t opcode) {
    for (const auto& spec : kCatalog) {
        if (spec.opcode == opcode) return &spec;
    }
    return nullptr;
}

std::string command_name(uint8_t opcode) {
    if (const CommandSpec* spec = find_command(opcode)) return spec->name;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", opcode);
    return buf;
}

// ============================================================================
// Commands and replies
// ============================================================================

// ----- build_command_body() -----
std::vector<uint8_t> build_command_body(uint8_t opcode, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> b;
    b.reserve(2 + payload.size());
    b.push_back(opcode);
    b.push_back(REQUEST_MARKER);
    b.insert(b.end(), payload.begin(), payload.end());
    return b;
}

// ----- parse_command_body() -----
bool parse_command_body(const std::vector<uint8_t>& body, uint8_t& opcode,
                        std::vector<uint8_t>& payload, std::string& err) {
    if (body.size() < 2)               { err = "short_command"; return false; }
    if (body[1] != REQUEST_MARKER)     { err = "not_a_command"; return false; }
    opcode = body[0];
    payload.assign(body.begin() + 2, body.end());
    return true;
}

// ----- build_reply_body() -----
std::vector<uint8_t> build_reply_body(uint8_t opcode, uint16_t status,
                                      const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> b;
    b.reserve(4 + payload.size());
    b.push_back(opcode);
    b.push_back(REPLY_MARKER);
    put_le16(b, status);
    if (status == 0) b.insert(b.end(), payload.begin(), payload.end());
    return b;
}

// ----- parse_reply() -----
bool parse_reply(const std::vector<uint8_t>& body, Reply& out, std::string& err) {
    if (body.size() < 4) { err = "short_reply"; return false; }
    if (body[1] != REPLY_MARKER) {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "not_a_reply:0x%02x", body[1]);
        err = buf;
        return false;
    }
    out.opcode = body[0];
    out.status = get_le16(body.data() + 2);
    if (out.status == 0) out.payload.assign(body.begin() + 4, body.end());
    else                 out.payload.clear();
    return true;
}

// ----- check_reply() -----
bool check_reply(const Reply& reply, std::string& err) {
    const CommandSpec* spec = find_command(reply.opcode);
    if (!spec || !reply.ok() || spec->reply_size < 0) return true;
    if (reply.payload.size() != static_cast<std::size_t>(spec->reply_size)) {
        err = std::string("bad_reply_size:") + spec->name;
        return false;
    }
    return true;
}

// ============================================================================
// Reports
// ============================================================================

// ----- build_report_body() -----
std::vector<uint8_t> build_report_body(const ReportStatus& report) {
    std::vector<uint8_t> b;
    b.reserve(4 + REPORT_BASIC_SIZE + REPORT_ENGINEERING_SIZE);
    const bool eng = report.type == ReportType::Engineering && report.engineering;

    b.push_back(static_cast<uint8_t>(eng ? ReportType::Engineering : ReportType::Basic));
    b.push_back(REPORT_HEAD);

    const ReportBasic& r = report.basic;
    put_u8  (b, r.target_status);
    put_le16(b, r.motion_distance);
    put_u8  (b, r.motion_energy);
    put_le16(b, r.standstill_distance);
    put_u8  (b, r.standstill_energy);
    put_le16(b, r.detection_distance);

    if (eng) {
        const ReportEngineering& e = *report.engineering;
        put_u8(b, e.motion_max_gate);
        put_u8(b, e.standstill_max_gate);
        for (std::size_t i = 0; i < GATE_COUNT; ++i)
            put_u8(b, i < e.motion_gate_energy.size() ? e.motion_gate_energy[i] : 0);
        for (std::size_t i = 0; i < GATE_COUNT; ++i)
            put_u8(b, i < e.standstill_gate_energy.size() ? e.standstill_gate_energy[i] : 0);
        put_u8(b, e.photosensitive);
        put_u8(b, e.out_pin);
    }

    b.push_back(REPORT_TAIL);
    b.push_back(REPORT_CALIBRATION);
    return b;
}

// ----- parse_report() -----
bool parse_report(const std::vector<uint8_t>& body, ReportStatus& out, std::string& err) {
    if (body.size() < 4 + REPORT_BASIC_SIZE) { err = "short_report"; return false; }

    const uint8_t type = body[0];
    std::size_t expect = 4 + REPORT_BASIC_SIZE;
    if (type == static_cast<uint8_t>(ReportType::Engineering)) {
        expect += REPORT_ENGINEERING_SIZE;
    } else if (type != static_cast<uint8_t>(ReportType::Basic)) {
        err = "bad_report_type:" + std::to_string(type);
        return false;
    }
    if (body[1] != REPORT_HEAD)  { err = "bad_report_head"; return false; }
    if (body.size() != expect)   { err = "bad_report_size"; return false; }
    if (body[expect - 2] != REPORT_TAIL || body[expect - 1] != REPORT_CALIBRATION) {
        err = "bad_report_tail";
        return false;
    }

    const uint8_t* p = body.data() + 2;
    ReportStatus r;
    r.type = static_cast<ReportType>(type);
    r.basic.target_status       = p[0];
    r.basic.motion_distance     = get_le16(p + 1);
    r.basic.motion_energy       = p[3];
    r.basic.standstill_distance = get_le16(p + 4);
    r.basic.standstill_energy   = p[6];
    r.basic.detection_distance  = get_le16(p + 7);
    p += REPORT_BASIC_SIZE;

    if (r.type == ReportType::Engineering) {
        ReportEngineering e;
        e.motion_max_gate     = p[0];
        e.standstill_max_gate = p[1];
        e.motion_gate_energy.assign(p + 2, p + 2 + GATE_COUNT);
        e.standstill_gate_energy.assign(p + 2 + GATE_COUNT, p + 2 + 2 * GATE_COUNT);
        e.photosensitive = p[2 + 2 * GATE_COUNT];
        e.out_pin        = p[3 + 2 * GATE_COUNT];
        r.engineering = e;
    }

    out = std::move(r);
    return true;
}

} // namespace ld2410
