// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// - See command_dispatch.hpp for names, contracts and examples.
// - Values are parsed and validated here, before a configuration session is
//   opened.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"
#include "ld2410/commands.hpp"

#include <cctype>     // std::tolower
#include <cstdio>     // std::snprintf
#include <cstdlib>    // strtoul
#include <sstream>

namespace ld2410 {

// ---------- local parsing helpers (no exceptions) ----------

static bool parse_u32(const std::string& s, uint32_t& out,
                      uint64_t lo = 0, uint64_t hi = 0xFFFFFFFFull) {
    if (s.empty()) return false;
    char* e = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &e, 0);
    if (!e || *e) return false;
    if (s[0] == '-') return false;
    if (v < lo || v > hi) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool parse_on_off(const std::string& raw, bool& out) {
    const std::string s = lower(raw);
    if (s == "1" || s == "on"  || s == "true"  || s == "yes") { out = true;  return true; }
    if (s == "0" || s == "off" || s == "false" || s == "no")  { out = false; return true; }
    return false;
}

static std::string hex32(uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", v);
    return buf;
}

static std::string hex16(uint16_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04x", v);
    return buf;
}

static bool bad_value(Error& err, const char* name) {
    return fail(err, ErrorCode::BadParameter, std::string("bad_value:") + name);
}

// ---------- mapping: (name, is_set) -> CommandKind ----------
bool name_to_kind(const std::string& raw_name, bool is_set, CommandKind& out_kind) {
    const std::string name = lower(raw_name);

    if (!is_set) {
        if (name == "fw" || name == "firmware")        { out_kind = CommandKind::GET_FW_VERSION; return true; }
        if (name == "mac" || name == "bt_address")     { out_kind = CommandKind::GET_BT_ADDRESS; return true; }
        if (name == "resolution")                      { out_kind = CommandKind::GET_RESOLUTION; return true; }
        if (name == "all")                             { out_kind = CommandKind::GET_ALL;        return true; }
    } else {
        if (name == "baud" || name == "baudrate")      { out_kind = CommandKind::SET_BAUD;        return true; }
        if (name == "resolution")                      { out_kind = CommandKind::SET_RESOLUTION;  return true; }
        if (name == "bluetooth" || name == "bt")       { out_kind = CommandKind::SET_BLUETOOTH;   return true; }
        if (name == "bt_password" || name == "password") { out_kind = CommandKind::SET_BT_PASSWORD; return true; }
        if (name == "engineering")                     { out_kind = CommandKind::SET_ENGINEERING; return true; }
    }

    // Actions read the same either way.
    if (name == "factory_reset") { out_kind = CommandKind::FACTORY_RESET; return true; }
    if (name == "restart")       { out_kind = CommandKind::RESTART;       return true; }

    return false;
}

const char* kind_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::GET_FW_VERSION:  return "fw";
        case CommandKind::GET_BT_ADDRESS:  return "mac";
        case CommandKind::GET_RESOLUTION:  return "resolution";
        case CommandKind::GET_ALL:         return "all";
        case CommandKind::SET_BAUD:        return "baud";
        case CommandKind::SET_RESOLUTION:  return "resolution";
        case CommandKind::SET_BLUETOOTH:   return "bluetooth";
        case CommandKind::SET_BT_PASSWORD: return "bt_password";
        case CommandKind::SET_ENGINEERING: return "engineering";
        case CommandKind::FACTORY_RESET:   return "factory_reset";
        case CommandKind::RESTART:         return "restart";
    }
    return "unknown";
}

bool kind_needs_value(CommandKind kind) {
    switch (kind) {
        case CommandKind::SET_BAUD:
        case CommandKind::SET_RESOLUTION:
        case CommandKind::SET_BLUETOOTH:
        case CommandKind::SET_BT_PASSWORD:
        case CommandKind::SET_ENGINEERING:
            return true;
        default:
            return false;
    }
}

// ---------- per-kind getters, run inside a session ----------

static bool read_firmware(Device& dev, Fields& out, Error& e) {
    FirmwareVersion fw;
    if (!dev.get_firmware_version(fw, e)) return false;
    out.emplace_back("fw_type", hex16(fw.type));
    out.emplace_back("fw_major", std::to_string(fw.major));
    out.emplace_back("fw_minor", std::to_string(fw.minor));
    out.emplace_back("fw_revision", hex32(fw.revision));
    return true;
}

static bool read_address(Device& dev, Fields& out, Error& e) {
    BluetoothAddress addr{};
    if (!dev.get_bluetooth_address(addr, e)) return false;
    out.emplace_back("bt_address", format_address(addr));
    return true;
}

static bool read_resolution(Device& dev, Fields& out, Error& e) {
    uint16_t cm = 0;
    if (!dev.get_distance_resolution(cm, e)) return false;
    out.emplace_back("resolution_cm", std::to_string(cm));
    return true;
}

// ---------- run_command() ----------
// Stage 1 parses the value, stage 2 runs the call inside with_configuration().
bool run_command(Device& dev, CommandKind kind, const std::string& value,
                 Fields& out, Error& err) {
    uint32_t number = 0;
    bool flag = false;
    uint16_t index = 0;

    switch (kind) {
        case CommandKind::SET_BAUD:
            if (!parse_u32(value, number) || !baud_rate_to_index(number, index))
                return bad_value(err, "baud");
            break;
        case CommandKind::SET_RESOLUTION:
            if (!parse_u32(value, number, 0, 0xFFFF) ||
                !resolution_to_index(static_cast<uint16_t>(number), index))
                return bad_value(err, "resolution");
            break;
        case CommandKind::SET_BLUETOOTH:
        case CommandKind::SET_ENGINEERING:
            if (!parse_on_off(value, flag)) return bad_value(err, kind_name(kind));
            break;
        case CommandKind::SET_BT_PASSWORD: {
            std::vector<uint8_t> scratch;
            if (!make_set_bluetooth_password(value, scratch, err)) return bad_value(err, "bt_password");
            break;
        }
        default:
            break;
    }

    Fields fields;
    auto body = [&](const ConfigModeStatus& st, Error& e) -> bool {
        switch (kind) {
            case CommandKind::GET_FW_VERSION: return read_firmware(dev, fields, e);
            case CommandKind::GET_BT_ADDRESS: return read_address(dev, fields, e);
            case CommandKind::GET_RESOLUTION: return read_resolution(dev, fields, e);

            case CommandKind::GET_ALL:
                fields.emplace_back("protocol_version", std::to_string(st.protocol_version));
                fields.emplace_back("buffer_size", std::to_string(st.buffer_size));
                return read_firmware(dev, fields, e)
                    && read_address(dev, fields, e)
                    && read_resolution(dev, fields, e);

            case CommandKind::SET_BAUD:
                if (!dev.set_baud_rate(number, e)) return false;
                fields.emplace_back("baud", std::to_string(number));
                return true;

            case CommandKind::SET_RESOLUTION:
                if (!dev.set_distance_resolution(static_cast<uint16_t>(number), e)) return false;
                fields.emplace_back("resolution_cm", std::to_string(number));
                return true;

            case CommandKind::SET_BLUETOOTH:
                if (!dev.set_bluetooth_mode(flag, e)) return false;
                fields.emplace_back("bluetooth", flag ? "on" : "off");
                return true;

            case CommandKind::SET_BT_PASSWORD:
                if (!dev.set_bluetooth_password(value, e)) return false;
                fields.emplace_back("bt_password", "set");
                return true;

            case CommandKind::SET_ENGINEERING:
                if (!dev.set_engineering_mode(flag, e)) return false;
                fields.emplace_back("engineering", flag ? "on" : "off");
                return true;

            case CommandKind::FACTORY_RESET:
                if (!dev.reset_to_factory(e)) return false;
                fields.emplace_back("factory_reset", "1");
                return true;

            case CommandKind::RESTART:
                fields.emplace_back("restarted", "1");
                return dev.restart_module(/*close_session=*/true, e);
        }
        return fail(e, ErrorCode::BadParameter, "unknown_command");
    };

    if (!dev.with_configuration(body, err)) return false;
    out = std::move(fields);
    return true;
}

// ---------- output ----------

std::string format_fields(const Fields& fields) {
    std::ostringstream os;
    os << "status=ok";
    for (const auto& kv : fields) os << ' ' << kv.first << '=' << kv.second;
    return os.str();
}

static std::string join_gates(const GateEnergies& g) {
    std::string s;
    for (std::size_t i = 0; i < g.size(); ++i) {
        if (i) s.push_back(',');
        s += std::to_string(g[i]);
    }
    return s;
}

Fields report_fields(const ReportStatus& report) {
    Fields f;
    const ReportBasic& b = report.basic;
    f.emplace_back("type", report.type == ReportType::Engineering ? "engineering" : "basic");
    f.emplace_back("moving", b.moving() ? "1" : "0");
    f.emplace_back("stationary", b.stationary() ? "1" : "0");
    f.emplace_back("motion_distance_cm", std::to_string(b.motion_distance));
    f.emplace_back("motion_energy", std::to_string(b.motion_energy));
    f.emplace_back("standstill_distance_cm", std::to_string(b.standstill_distance));
    f.emplace_back("standstill_energy", std::to_string(b.standstill_energy));
    f.emplace_back("detection_distance_cm", std::to_string(b.detection_distance));

    if (report.engineering) {
        const ReportEngineering& e = *report.engineering;
        f.emplace_back("motion_max_gate", std::to_string(e.motion_max_gate));
        f.emplace_back("standstill_max_gate", std::to_string(e.standstill_max_gate));
        f.emplace_back("motion_gates", join_gates(e.motion_gate_energy));
        f.emplace_back("standstill_gates", join_gates(e.standstill_gate_energy));
        f.emplace_back("photosensitive", std::to_string(e.photosensitive));
        f.emplace_back("out_pin", e.out_pin ? "high" : "low");
    }
    return f;
}

} // namespace ld2410
