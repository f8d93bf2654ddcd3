#include <doctest/doctest.h>
#include "ld2410/frame_stream.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace ld2410;
using ld2410::testing::LogCapture;

static std::vector<uint8_t> make_frame(FrameKind kind, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> out;
    std::string err;
    REQUIRE(encode_frame(kind, body, out, err));
    return out;
}

static std::vector<uint8_t> concat(std::vector<uint8_t> a, const std::vector<uint8_t>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

TEST_CASE("Consecutive frames in one chunk are all decoded in order") {
    const auto a = make_frame(FrameKind::Command, {0xFF, 0x01, 0x00, 0x00, 0x01, 0x00, 0x40, 0x00});
    const auto b = make_frame(FrameKind::Report, {0x02, 0xAA, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x55, 0x00});

    FrameStream stream;
    CHECK(stream.push(concat(a, b)) == a.size() + b.size());
    auto frames = stream.read_frames();

    REQUIRE(frames.size() == 2);
    CHECK(frames[0].kind == FrameKind::Command);
    CHECK(frames[1].kind == FrameKind::Report);
    CHECK(stream.remaining() == 0);
}

TEST_CASE("Garbage before a frame is skipped with one log line") {
    LogCapture logs;
    const std::vector<uint8_t> garbage = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    const auto frame = make_frame(FrameKind::Command, {0xFE, 0x00});

    FrameStream stream;
    stream.push(concat(garbage, frame));
    auto frames = stream.read_frames();

    REQUIRE(frames.size() == 1);
    CHECK(frames[0].body == std::vector<uint8_t>{0xFE, 0x00});

    auto skips = logs.matching("garbage bytes");
    REQUIRE(skips.size() == 1);
    CHECK(skips[0] == "Skipping 7 garbage bytes: 01020304050607");
    CHECK(stream.stats().garbage_bytes == 7);
}

TEST_CASE("A frame split at every offset yields nothing, then exactly one frame") {
    const auto frame = make_frame(FrameKind::Command, {0xA0, 0x01, 0x00, 0x00, 0x00, 0x01, 0x04, 0x02, 0x16, 0x24, 0x06, 0x22});

    for (std::size_t cut = 1; cut < frame.size(); ++cut) {
        CAPTURE(cut);
        FrameStream stream;
        stream.push(frame.data(), cut);
        CHECK(stream.read_frames().empty());

        stream.push(frame.data() + cut, frame.size() - cut);
        auto frames = stream.read_frames();
        REQUIRE(frames.size() == 1);
        CHECK(frames[0].body.size() == 12);
    }
}

TEST_CASE("Corrupted footer frame followed by a valid one yields only the valid one") {
    LogCapture logs;
    const auto frame = make_frame(FrameKind::Command, {0xFE, 0x00});
    // drop the last footer byte of the first copy
    std::vector<uint8_t> broken(frame.begin(), frame.end() - 1);

    FrameStream stream;
    stream.push(concat(broken, frame));
    auto frames = stream.read_frames();

    REQUIRE(frames.size() == 1);
    CHECK(frames[0].body == std::vector<uint8_t>{0xFE, 0x00});

    auto corrupted = logs.matching("corrupted header");
    REQUIRE(corrupted.size() == 1);
    CHECK(corrupted[0] == "Skipping corrupted header: fdfcfbfa");

    // what is left of the broken frame after its header: 12 - 1 - 4 bytes
    auto skips = logs.matching("garbage bytes");
    REQUIRE(skips.size() == 1);
    CHECK(skips[0].rfind("Skipping 7 garbage bytes:", 0) == 0);
    CHECK(stream.remaining() == 0);
}

TEST_CASE("Full-length frame with a wrong footer byte is skipped by its header") {
    LogCapture logs;
    const auto frame = make_frame(FrameKind::Command, {0xFE, 0x00});
    std::vector<uint8_t> broken = frame;
    broken.back() = 0x00;   // footer 04 03 02 00

    FrameStream stream;
    stream.push(concat(broken, frame));
    auto frames = stream.read_frames();

    REQUIRE(frames.size() == 1);
    CHECK(frames[0].body == std::vector<uint8_t>{0xFE, 0x00});
    CHECK(stream.stats().corrupted_headers == 1);

    auto corrupted = logs.matching("corrupted header");
    REQUIRE(corrupted.size() == 1);
    CHECK(corrupted[0] == "Skipping corrupted header: fdfcfbfa");

    // length, body and the bad footer of the first copy
    auto skips = logs.matching("garbage bytes");
    REQUIRE(skips.size() == 1);
    CHECK(skips[0] == "Skipping 8 garbage bytes: 0200fe0004030200");
    CHECK(stream.remaining() == 0);
}

TEST_CASE("Report frame with a wrong footer byte is skipped the same way") {
    LogCapture logs;
    const std::vector<uint8_t> body = {0x02, 0xAA, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x55, 0x00};
    const auto good = make_frame(FrameKind::Report, body);
    std::vector<uint8_t> broken = good;
    broken[broken.size() - 4] = 0xF9;

    FrameStream stream;
    stream.push(concat(broken, good));
    auto frames = stream.read_frames();

    REQUIRE(frames.size() == 1);
    CHECK(frames[0].kind == FrameKind::Report);
    CHECK(frames[0].body == body);
    CHECK(logs.count("Skipping corrupted header: f4f3f2f1") == 1);
}

TEST_CASE("Output does not depend on chunking") {
    const auto a = make_frame(FrameKind::Command, {0xFF, 0x01, 0x00, 0x00, 0x01, 0x00, 0x40, 0x00});
    const auto b = make_frame(FrameKind::Report, {0x02, 0xAA, 0x03, 0x10, 0x00, 0x40, 0x20, 0x00, 0x30, 0x50, 0x00, 0x55, 0x00});
    std::vector<uint8_t> input = {0x55, 0x66};
    input = concat(input, a);
    input.insert(input.end(), {0x99, 0x98, 0x97});
    input = concat(input, b);
    input = concat(input, std::vector<uint8_t>(a.begin(), a.end() - 2));   // corrupted footer
    input = concat(input, a);

    LogCapture quiet;   // keep skip warnings off stderr

    FrameStream whole;
    whole.push(input);
    const auto expected = whole.read_frames();
    REQUIRE(expected.size() == 3);

    for (std::size_t step : {std::size_t{1}, std::size_t{2}, std::size_t{3}, std::size_t{7}, std::size_t{16}}) {
        CAPTURE(step);
        FrameStream chunked;
        std::vector<Frame> got;
        for (std::size_t off = 0; off < input.size(); off += step) {
            const std::size_t n = std::min(step, input.size() - off);
            chunked.push(input.data() + off, n);
            for (auto& f : chunked.read_frames()) got.push_back(std::move(f));
        }
        REQUIRE(got.size() == expected.size());
        for (std::size_t i = 0; i < got.size(); ++i) {
            CHECK(got[i].kind == expected[i].kind);
            CHECK(got[i].body == expected[i].body);
        }
    }
}

TEST_CASE("Bytes without any header are kept, not discarded") {
    FrameStream stream;
    const std::vector<uint8_t> noise(12, 0x42);
    stream.push(noise);
    CHECK(stream.read_frames().empty());
    CHECK(stream.remaining() == 12);

    // a frame arriving later still comes out, after the noise is skipped
    LogCapture logs;
    stream.push(make_frame(FrameKind::Command, {0xFE, 0x00}));
    CHECK(stream.read_frames().size() == 1);
    CHECK(logs.count("Skipping 12 garbage bytes") == 1);
}

TEST_CASE("Header split across pushes survives") {
    const auto frame = make_frame(FrameKind::Report, {0x02, 0xAA, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x55, 0x00});
    std::vector<uint8_t> first(10, 0x00);
    first.push_back(frame[0]);
    first.push_back(frame[1]);

    LogCapture quiet;
    FrameStream stream;
    stream.push(first);
    CHECK(stream.read_frames().empty());

    stream.push(frame.data() + 2, frame.size() - 2);
    CHECK(stream.read_frames().size() == 1);
}

TEST_CASE("Buffer is compacted once everything is consumed") {
    FrameStream stream;
    const auto frame = make_frame(FrameKind::Command, {0xFE, 0x00});
    stream.push(frame);
    Frame f;
    REQUIRE(stream.next(f));
    CHECK(stream.buffered() == frame.size());   // consumed but not yet compacted
    CHECK_FALSE(stream.next(f));
    CHECK(stream.buffered() == 0);
}

TEST_CASE("Incomplete trailing frame stays buffered") {
    const auto frame = make_frame(FrameKind::Command, {0xFE, 0x00});
    FrameStream stream;
    stream.push(concat(frame, std::vector<uint8_t>(frame.begin(), frame.begin() + 9)));
    CHECK(stream.read_frames().size() == 1);
    CHECK(stream.remaining() == 9);
}
