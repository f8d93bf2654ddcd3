#pragma once
/**
 * @page ld2410-frame-stream Stream Reassembler
 * @file frame_stream.hpp
 * @brief Turn an arbitrary chunked byte stream into discrete frames.
 *
 * @details
 * PURPOSE
 * -------
 * Serial reads deliver whatever the UART buffered: half a frame, three
 * frames, line noise from a module booting. FrameStream accumulates chunks
 * and hands out complete frames, resynchronizing on garbage and on frames
 * whose footer does not match.
 *
 * BEHAVIOUR
 * ---------
 * - push() only appends; it never decodes.
 * - next() decodes from the read cursor until it yields a frame or can make
 *   no more progress. Calling next() again later (after another push)
 *   resumes where it stopped.
 * - Garbage in front of a header is skipped and logged as
 *   "Skipping N garbage bytes: <hex>".
 * - A header whose declared frame is fully buffered but fails to decode is
 *   skipped (4 bytes) and logged as "Skipping corrupted header: <hex>".
 * - When no header occurs at all, the bytes are kept: a header may be split
 *   across two reads.
 * - The buffer is compacted once the cursor reaches its end.
 *
 * The output does not depend on how the input was chunked.
 *
 * EXAMPLE
 * -------
 *   ld2410::FrameStream stream;
 *   stream.push(chunk.data(), chunk.size());
 *   ld2410::Frame f;
 *   while (stream.next(f)) handle(f);
 */

#include "ld2410/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ld2410 {

class FrameStream {
public:
    struct Stats {
        uint64_t frames{0};
        uint64_t garbage_bytes{0};
        uint64_t corrupted_headers{0};
    };

    FrameStream() = default;

    /// Append raw bytes. Returns how many were appended.
    std::size_t push(const uint8_t* data, std::size_t len);
    std::size_t push(const std::vector<uint8_t>& data) { return push(data.data(), data.size()); }

    /// Decode the next frame, if any is complete.
    bool next(Frame& out);

    /// Drain every frame currently decodable.
    std::vector<Frame> read_frames();

    /// Bytes after the read cursor, not yet consumed.
    std::size_t remaining() const { return buf_.size() - cursor_; }

    /// Total bytes held, including the consumed prefix awaiting compaction.
    std::size_t buffered() const { return buf_.size(); }

    const Stats& stats() const { return stats_; }

private:
    void compact();

    std::vector<uint8_t> buf_;
    std::size_t cursor_{0};
    Stats stats_;
};

} // namespace ld2410
