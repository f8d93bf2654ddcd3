#pragma once
/**
 * @file config.hpp
 * @brief Client settings and their JSON file form.
 *
 * @details
 * Settings resolve in increasing priority: built-in defaults, the JSON file,
 * then whatever the caller (the CLI) overrides. The default file is
 *   $XDG_CONFIG_HOME/ld2410/config.json   (fallback ~/.config/ld2410/config.json)
 *
 * FILE FORMAT
 * -----------
 *   {
 *     "device": "/dev/ttyUSB0",
 *     "baudrate": 256000,
 *     "command_timeout_ms": 2000,     // 0 or null: wait forever
 *     "read_chunk": 2048,
 *     "poll_interval_ms": 100
 *   }
 *
 * Every key is optional; unknown keys are ignored. A missing file is not an
 * error. A malformed file or a value of the wrong type fails with
 * `bad_config:<key>` (or `bad_config:parse`).
 */

#include "ld2410/models.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ld2410 {

struct DeviceConfig {
    std::string device;
    uint32_t    baudrate{DEFAULT_BAUDRATE};
    std::optional<std::chrono::milliseconds> command_timeout{std::chrono::milliseconds(2000)};
    std::size_t read_chunk{2048};
    int         poll_interval_ms{100};
};

/// Path of the per-user config file (may not exist).
std::string default_config_path();

/// Apply the JSON document in @p text on top of @p cfg.
bool parse_config(const std::string& text, DeviceConfig& cfg, std::string& err);

/// Apply the file at @p path on top of @p cfg. Missing file: true, cfg untouched.
bool load_config(const std::string& path, DeviceConfig& cfg, std::string& err);

} // namespace ld2410
