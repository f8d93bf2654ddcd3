#pragma once
/**
 * @page ld2410-frame LD2410 Frame Codec
 * @file frame.hpp
 * @brief Encode/decode one length-delimited LD2410 frame.
 *
 * @details
 * WIRE LAYOUT
 * -----------
 *   [header:4][length:LE16][body:length][footer:4]
 *
 * Two disjoint header/footer pairs select the frame kind:
 *   - Command class (commands and their replies):
 *       header FD FC FB FA, footer 04 03 02 01
 *   - Report class (unsolicited status reports):
 *       header F4 F3 F2 F1, footer F8 F7 F6 F5
 *
 * The smallest possible frame is 10 bytes (empty body).
 *
 * DECODING RULES
 * --------------
 * - Fewer than 4 bytes: NeedMoreData (the header may still arrive).
 * - Unknown header: Invalid.
 * - Declared length is not trusted: the decoder waits for 10 + length bytes.
 * - Footer that does not belong to the header's kind: Invalid.
 *
 * ENCODING RULES
 * --------------
 * - The length field is always recomputed from the body; a Frame can never
 *   carry a stale length.
 * - Bodies larger than 65535 bytes cannot be represented and are rejected.
 *
 * EXAMPLE
 * -------
 *   const uint8_t raw[] = {0xFD,0xFC,0xFB,0xFA, 0x02,0x00, 0xFE,0x00,
 *                          0x04,0x03,0x02,0x01};
 *   ld2410::Frame f; std::size_t used = 0;
 *   if (ld2410::decode_frame(raw, sizeof(raw), f, used) == ld2410::DecodeStatus::Ok) {
 *       // f.kind == FrameKind::Command, f.body == {0xFE, 0x00}, used == 12
 *   }
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ld2410 {

enum class FrameKind : uint8_t {
    Command = 1,   ///< command request or reply
    Report  = 2    ///< asynchronous status report
};

constexpr std::size_t FRAME_HEADER_SIZE = 4;
constexpr std::size_t FRAME_LENGTH_SIZE = 2;
constexpr std::size_t FRAME_FOOTER_SIZE = 4;
constexpr std::size_t FRAME_MIN_SIZE    = FRAME_HEADER_SIZE + FRAME_LENGTH_SIZE + FRAME_FOOTER_SIZE;
constexpr std::size_t FRAME_MAX_BODY    = 0xFFFF;

constexpr std::array<uint8_t, 4> COMMAND_HEADER = {0xFD, 0xFC, 0xFB, 0xFA};
constexpr std::array<uint8_t, 4> COMMAND_FOOTER = {0x04, 0x03, 0x02, 0x01};
constexpr std::array<uint8_t, 4> REPORT_HEADER  = {0xF4, 0xF3, 0xF2, 0xF1};
constexpr std::array<uint8_t, 4> REPORT_FOOTER  = {0xF8, 0xF7, 0xF6, 0xF5};

/**
 * @brief One decoded frame. The length on the wire is body.size().
 */
struct Frame {
    FrameKind kind{FrameKind::Command};
    std::vector<uint8_t> body;

    uint16_t length() const { return static_cast<uint16_t>(body.size()); }
};

enum class DecodeStatus : uint8_t { Ok = 0, NeedMoreData = 1, Invalid = 2 };

const char* kind_name(FrameKind kind);
const std::array<uint8_t, 4>& header_for(FrameKind kind);
const std::array<uint8_t, 4>& footer_for(FrameKind kind);

/// Classify 4 header bytes. False when they match neither kind.
bool kind_from_header(const uint8_t* p, FrameKind& out);

/**
 * @brief Earliest offset at which either frame header starts.
 * @return false when no complete header occurs in [p, p+n).
 */
bool find_header(const uint8_t* p, std::size_t n, std::size_t& offset);

/**
 * @brief Try to decode a frame at the very start of [data, data+len).
 * On Ok, @p out holds the frame and @p consumed its full size on the wire.
 */
DecodeStatus decode_frame(const uint8_t* data, std::size_t len,
                          Frame& out, std::size_t& consumed);

/**
 * @brief Serialize a frame of @p kind around @p body.
 * @return false with err="body_too_large" if the body exceeds 65535 bytes.
 */
bool encode_frame(FrameKind kind, const std::vector<uint8_t>& body,
                  std::vector<uint8_t>& out, std::string& err);

inline bool encode_frame(const Frame& f, std::vector<uint8_t>& out, std::string& err) {
    return encode_frame(f.kind, f.body, out, err);
}

} // namespace ld2410
