// -----------------------------------------------------------------------------
// frame_stream.cpp: implementation for frame_stream.hpp
// -----------------------------------------------------------------------------

#include "ld2410/frame_stream.hpp"
#include "ld2410/bytes.hpp"
#include "ld2410/logging.hpp"

namespace ld2410 {

// ----- push() -----
std::size_t FrameStream::push(const uint8_t* data, std::size_t len) {
    if (!data || !len) return 0;
    buf_.insert(buf_.end(), data, data + len);
    return len;
}

// ----- next() -----
// 1. decode at the cursor
// 2. fewer than a minimal frame left: wait (compact when empty)
// 3. garbage before the first header: skip it
// 4. header at the cursor whose frame is complete but invalid: skip the header
// 5. header at the cursor whose frame is incomplete, or no header: wait
bool FrameStream::next(Frame& out) {
    auto& log = Logger::instance();

    for (;;) {
        const uint8_t* p = buf_.data() + cursor_;
        const std::size_t remain = remaining();

        std::size_t used = 0;
        if (decode_frame(p, remain, out, used) == DecodeStatus::Ok) {
            cursor_ += used;
            ++stats_.frames;
            return true;
        }

        if (remain < FRAME_MIN_SIZE) {
            if (remain == 0) compact();
            return false;
        }

        std::size_t offset = 0;
        if (!find_header(p, remain, offset)) return false;

        if (offset > 0) {
            log.log(LogLevel::WARN, "Skipping %zu garbage bytes: %s",
                    offset, to_hex(p, offset).c_str());
            cursor_ += offset;
            stats_.garbage_bytes += offset;
            continue;
        }

        const std::size_t declared = get_le16(p + FRAME_HEADER_SIZE);
        if (remain < FRAME_MIN_SIZE + declared) return false;

        log.log(LogLevel::WARN, "Skipping corrupted header: %s",
                to_hex(p, FRAME_HEADER_SIZE).c_str());
        cursor_ += FRAME_HEADER_SIZE;
        ++stats_.corrupted_headers;
    }
}

// ----- read_frames() -----
std::vector<Frame> FrameStream::read_frames() {
    std::vector<Frame> frames;
    Frame f;
    while (next(f)) frames.push_back(std::move(f));
    return frames;
}

void FrameStream::compact() {
    buf_.clear();
    cursor_ = 0;
}

} // namespace ld2410
