#pragma once
/**
 * @file models.hpp
 * @brief Value types returned by the LD2410 client.
 *
 * Plain structs, copyable, no behaviour beyond small accessors. Fixed-size
 * fields use ETL containers so their capacity is part of the type.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "etl/string.h"
#include "etl/vector.h"

namespace ld2410 {

constexpr std::size_t GATE_COUNT          = 9;   ///< distance gates 0..8
constexpr std::size_t BT_PASSWORD_MAX     = 6;
constexpr uint32_t    DEFAULT_BAUDRATE    = 256000;

/// Reply payload of the config-enable command.
struct ConfigModeStatus {
    uint16_t protocol_version{0};
    uint16_t buffer_size{0};
};

struct FirmwareVersion {
    uint16_t type{0};
    uint8_t  major{0};
    uint8_t  minor{0};
    uint32_t revision{0};
};

using BluetoothAddress  = std::array<uint8_t, 6>;
using BluetoothPassword = etl::string<BT_PASSWORD_MAX>;
using GateEnergies      = etl::vector<uint8_t, GATE_COUNT>;

/// "8c:aa:b5:01:02:03"
std::string format_address(const BluetoothAddress& addr);

enum class ReportType : uint8_t {
    Engineering = 1,
    Basic       = 2
};

/// Bits of ReportBasic::target_status.
enum TargetStatusBits : uint8_t {
    TARGET_MOTION     = 0x01,
    TARGET_STANDSTILL = 0x02
};

/// Target block present in every report. Distances in cm, energies in %.
struct ReportBasic {
    uint8_t  target_status{0};
    uint16_t motion_distance{0};
    uint8_t  motion_energy{0};
    uint16_t standstill_distance{0};
    uint8_t  standstill_energy{0};
    uint16_t detection_distance{0};

    bool moving() const     { return (target_status & TARGET_MOTION) != 0; }
    bool stationary() const { return (target_status & TARGET_STANDSTILL) != 0; }
};

/// Extra block sent while engineering mode is on.
struct ReportEngineering {
    uint8_t      motion_max_gate{0};
    uint8_t      standstill_max_gate{0};
    GateEnergies motion_gate_energy;
    GateEnergies standstill_gate_energy;
    uint8_t      photosensitive{0};    ///< 0..255
    uint8_t      out_pin{0};           ///< 0 = low, 1 = high
};

struct ReportStatus {
    ReportType                       type{ReportType::Basic};
    ReportBasic                      basic;
    std::optional<ReportEngineering> engineering;
};

} // namespace ld2410
