#pragma once
/**
 * @page ld2410-commands LD2410 Command Payloads
 * @file commands.hpp
 * @brief Request payload builders and reply payload decoders.
 *
 * @details
 * PURPOSE
 * -------
 * The protocol engine moves opaque payloads keyed by opcode. This layer is
 * the collaborator that knows what goes inside them for the commands the
 * client exposes: it validates user values before anything is encoded, and
 * turns reply payloads back into the value types from models.hpp.
 *
 * VALIDATION
 * ----------
 * Builders reject values the module cannot accept and return
 * ErrorCode::BadParameter with a `bad_value:<field>` reason:
 *   - baud rate: 9600, 19200, 38400, 57600, 115200, 230400, 256000, 460800
 *   - bluetooth password: at most 6 ASCII characters
 *   - distance resolution: 20 or 75 (cm)
 *
 * Decoders return ErrorCode::BadReply when a payload is short or carries a
 * value this client does not know.
 *
 * EXAMPLE
 * -------
 *   std::vector<uint8_t> payload;
 *   ld2410::Error err;
 *   if (!ld2410::make_set_baud_rate(115200, payload, err)) {
 *       std::cerr << "status=error reason=" << err.reason << "\n";  // never reached
 *   }
 *   // payload == {0x05, 0x00}
 */

#include "ld2410/errors.hpp"
#include "ld2410/models.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ld2410 {

// ---------------------------------------------------------------------------
// Request payloads
// ---------------------------------------------------------------------------

/// Config-enable payload: the command value 0x0001.
std::vector<uint8_t> make_config_enable();

/// Bluetooth MAC query payload: the command value 0x0001.
std::vector<uint8_t> make_get_bluetooth_address();

bool baud_rate_to_index(uint32_t baud, uint16_t& index);
bool index_to_baud_rate(uint16_t index, uint32_t& baud);
bool make_set_baud_rate(uint32_t baud, std::vector<uint8_t>& out, Error& err);

std::vector<uint8_t> make_set_bluetooth_mode(bool enabled);
bool make_set_bluetooth_password(const std::string& password, std::vector<uint8_t>& out, Error& err);

bool resolution_to_index(uint16_t cm, uint16_t& index);
bool index_to_resolution(uint16_t index, uint16_t& cm);
bool make_set_distance_resolution(uint16_t cm, std::vector<uint8_t>& out, Error& err);

// ---------------------------------------------------------------------------
// Reply payloads
// ---------------------------------------------------------------------------

bool decode_config_mode(const std::vector<uint8_t>& payload, ConfigModeStatus& out, Error& err);
bool decode_firmware_version(const std::vector<uint8_t>& payload, FirmwareVersion& out, Error& err);
bool decode_bluetooth_address(const std::vector<uint8_t>& payload, BluetoothAddress& out, Error& err);
bool decode_distance_resolution(const std::vector<uint8_t>& payload, uint16_t& cm, Error& err);

// Encoders for the same payloads, used when answering as the device.
std::vector<uint8_t> encode_config_mode(const ConfigModeStatus& s);
std::vector<uint8_t> encode_firmware_version(const FirmwareVersion& v);

} // namespace ld2410
