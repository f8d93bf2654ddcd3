// -----------------------------------------------------------------------------
// frame.cpp: implementation for frame.hpp
//
// Pure functions, no allocation beyond the decoded body. Shared by the
// stream reassembler, the connection pump and the test emulator.
// -----------------------------------------------------------------------------

#include "ld2410/frame.hpp"
#include "ld2410/bytes.hpp"

#include <algorithm>   // std::equal
#include <cstring>     // std::memcmp

namespace ld2410 {

// ----- kind_name() -----
const char* kind_name(FrameKind kind) {
    switch (kind) {
        case FrameKind::Command: return "command";
        case FrameKind::Report:  return "report";
    }
    return "unknown";
}

// ----- header_for() / footer_for() -----
const std::array<uint8_t, 4>& header_for(FrameKind kind) {
    return kind == FrameKind::Report ? REPORT_HEADER : COMMAND_HEADER;
}

const std::array<uint8_t, 4>& footer_for(FrameKind kind) {
    return kind == FrameKind::Report ? REPORT_FOOTER : COMMAND_FOOTER;
}

// ----- kind_from_header() -----
bool kind_from_header(const uint8_t* p, FrameKind& out) {
    if (std::memcmp(p, COMMAND_HEADER.data(), FRAME_HEADER_SIZE) == 0) {
        out = FrameKind::Command;
        return true;
    }
    if (std::memcmp(p, REPORT_HEADER.data(), FRAME_HEADER_SIZE) == 0) {
        out = FrameKind::Report;
        return true;
    }
    return false;
}

// ----- find_header() -----
// Linear scan; both headers start with a byte >= 0xF4 so most positions are
// rejected on the first compare.
bool find_header(const uint8_t* p, std::size_t n, std::size_t& offset) {
    if (n < FRAME_HEADER_SIZE) return false;
    FrameKind ignored;
    for (std::size_t i = 0; i + FRAME_HEADER_SIZE <= n; ++i) {
        if (kind_from_header(p + i, ignored)) {
            offset = i;
            return true;
        }
    }
    return false;
}

// ----- decode_frame() -----
DecodeStatus decode_frame(const uint8_t* data, std::size_t len,
                          Frame& out, std::size_t& consumed) {
    consumed = 0;
    if (len < FRAME_HEADER_SIZE) return DecodeStatus::NeedMoreData;

    FrameKind kind;
    if (!kind_from_header(data, kind)) return DecodeStatus::Invalid;

    if (len < FRAME_HEADER_SIZE + FRAME_LENGTH_SIZE) return DecodeStatus::NeedMoreData;
    const std::size_t body_len = get_le16(data + FRAME_HEADER_SIZE);
    const std::size_t total    = FRAME_MIN_SIZE + body_len;
    if (len < total) return DecodeStatus::NeedMoreData;

    const uint8_t* body   = data + FRAME_HEADER_SIZE + FRAME_LENGTH_SIZE;
    const uint8_t* footer = body + body_len;
    const auto& expect    = footer_for(kind);
    if (!std::equal(expect.begin(), expect.end(), footer)) return DecodeStatus::Invalid;

    out.kind = kind;
    out.body.assign(body, body + body_len);
    consumed = total;
    return DecodeStatus::Ok;
}

// ----- encode_frame() -----
bool encode_frame(FrameKind kind, const std::vector<uint8_t>& body,
                  std::vector<uint8_t>& out, std::string& err) {
    if (body.size() > FRAME_MAX_BODY) {
        err = "body_too_large";
        return false;
    }
    const auto& head = header_for(kind);
    const auto& tail = footer_for(kind);

    out.clear();
    out.reserve(FRAME_MIN_SIZE + body.size());
    out.insert(out.end(), head.begin(), head.end());
    put_le16(out, static_cast<uint16_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    out.insert(out.end(), tail.begin(), tail.end());
    return true;
}

} // namespace ld2410
