#pragma once
/**
 * @file bytes.hpp
 * @brief Little/big-endian field helpers and hex dumping for LD2410 payloads.
 *
 * Every multi-byte field on the wire is little-endian except the firmware
 * type word, which the module sends big-endian.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ld2410 {

// ---------------------------------------------------------------------------
// Appenders: marshal native values into a growing byte vector.
// ---------------------------------------------------------------------------
inline void put_u8(std::vector<uint8_t>& b, uint8_t v) { b.push_back(v); }

inline void put_le16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));   // low byte first
    b.push_back(static_cast<uint8_t>(v >> 8));
}

inline void put_le32(std::vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// ---------------------------------------------------------------------------
// Readers: caller guarantees the bytes are there.
// ---------------------------------------------------------------------------
inline uint16_t get_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint16_t get_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t get_le32(const uint8_t* p) {
    return  static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

/// Lowercase hex, no separators ("fdfcfbfa0200"). Used for log lines.
inline std::string to_hex(const uint8_t* p, std::size_t n) {
    static const char* digits = "0123456789abcdef";
    std::string s;
    s.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        s.push_back(digits[p[i] >> 4]);
        s.push_back(digits[p[i] & 0x0F]);
    }
    return s;
}

inline std::string to_hex(const std::vector<uint8_t>& v) {
    return to_hex(v.data(), v.size());
}

} // namespace ld2410
