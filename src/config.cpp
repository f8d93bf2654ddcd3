// -----------------------------------------------------------------------------
// config.cpp: implementation for config.hpp
// -----------------------------------------------------------------------------

#include "ld2410/config.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>      // getenv
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ld2410 {

// ----- default_config_path() -----
std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    fs::path base;
    if (xdg && *xdg) {
        base = fs::path(xdg);
    } else {
        const char* home = std::getenv("HOME");
        base = fs::path(home ? home : ".") / ".config";
    }
    return (base / "ld2410" / "config.json").string();
}

// ----- parse_config() -----
// Values are checked before anything is applied, so a bad document leaves
// @p cfg untouched.
bool parse_config(const std::string& text, DeviceConfig& cfg, std::string& err) {
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) { err = "bad_config:parse"; return false; }

    DeviceConfig next = cfg;

    if (j.contains("device")) {
        const auto& v = j["device"];
        if (!v.is_string()) { err = "bad_config:device"; return false; }
        next.device = v.get<std::string>();
    }
    if (j.contains("baudrate")) {
        const auto& v = j["baudrate"];
        if (!v.is_number_unsigned() || v.get<uint64_t>() == 0 || v.get<uint64_t>() > 4000000) {
            err = "bad_config:baudrate";
            return false;
        }
        next.baudrate = v.get<uint32_t>();
    }
    if (j.contains("command_timeout_ms")) {
        const auto& v = j["command_timeout_ms"];
        if (v.is_null()) {
            next.command_timeout.reset();
        } else if (v.is_number_unsigned()) {
            const auto ms = v.get<uint64_t>();
            if (ms == 0) next.command_timeout.reset();
            else         next.command_timeout = std::chrono::milliseconds(ms);
        } else {
            err = "bad_config:command_timeout_ms";
            return false;
        }
    }
    if (j.contains("read_chunk")) {
        const auto& v = j["read_chunk"];
        if (!v.is_number_unsigned() || v.get<uint64_t>() == 0 || v.get<uint64_t>() > 65536) {
            err = "bad_config:read_chunk";
            return false;
        }
        next.read_chunk = v.get<std::size_t>();
    }
    if (j.contains("poll_interval_ms")) {
        const auto& v = j["poll_interval_ms"];
        if (!v.is_number_unsigned() || v.get<uint64_t>() == 0 || v.get<uint64_t>() > 10000) {
            err = "bad_config:poll_interval_ms";
            return false;
        }
        next.poll_interval_ms = v.get<int>();
    }

    cfg = next;
    return true;
}

// ----- load_config() -----
bool load_config(const std::string& path, DeviceConfig& cfg, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;

    std::ifstream in(path);
    if (!in) { err = "bad_config:unreadable"; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), cfg, err);
}

} // namespace ld2410
