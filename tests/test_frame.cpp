#include <doctest/doctest.h>
#include "ld2410/frame.hpp"

#include <string>
#include <vector>

using namespace ld2410;

static const std::vector<uint8_t> kConfigDisableFrame = {
    0xFD, 0xFC, 0xFB, 0xFA, 0x02, 0x00, 0xFE, 0x00, 0x04, 0x03, 0x02, 0x01
};

TEST_CASE("Config-disable frame decodes to a 2-byte command body and re-encodes identically") {
    Frame f;
    std::size_t used = 0;
    REQUIRE(decode_frame(kConfigDisableFrame.data(), kConfigDisableFrame.size(), f, used) == DecodeStatus::Ok);

    CHECK(f.kind == FrameKind::Command);
    CHECK(f.length() == 2);
    CHECK(f.body == std::vector<uint8_t>{0xFE, 0x00});
    CHECK(used == 12);

    std::vector<uint8_t> out;
    std::string err;
    REQUIRE(encode_frame(f, out, err));
    CHECK(out == kConfigDisableFrame);
}

TEST_CASE("Report frames use their own header and footer") {
    std::vector<uint8_t> out;
    std::string err;
    REQUIRE(encode_frame(FrameKind::Report, {0x02, 0xAA, 0x55, 0x00}, out, err));

    CHECK(std::vector<uint8_t>(out.begin(), out.begin() + 4) == std::vector<uint8_t>{0xF4, 0xF3, 0xF2, 0xF1});
    CHECK(std::vector<uint8_t>(out.end() - 4, out.end()) == std::vector<uint8_t>{0xF8, 0xF7, 0xF6, 0xF5});
    CHECK(out[4] == 0x04);
    CHECK(out[5] == 0x00);

    Frame f;
    std::size_t used = 0;
    REQUIRE(decode_frame(out.data(), out.size(), f, used) == DecodeStatus::Ok);
    CHECK(f.kind == FrameKind::Report);
    CHECK(used == out.size());
}

TEST_CASE("Empty body is the 10-byte minimum frame") {
    std::vector<uint8_t> out;
    std::string err;
    REQUIRE(encode_frame(FrameKind::Command, {}, out, err));
    CHECK(out.size() == FRAME_MIN_SIZE);

    Frame f;
    std::size_t used = 0;
    CHECK(decode_frame(out.data(), out.size(), f, used) == DecodeStatus::Ok);
    CHECK(f.body.empty());
}

TEST_CASE("Encoding recomputes the length field from the body") {
    Frame f;
    f.kind = FrameKind::Command;
    f.body.assign(300, 0x5A);

    std::vector<uint8_t> out;
    std::string err;
    REQUIRE(encode_frame(f, out, err));
    CHECK(out[4] == (300 & 0xFF));
    CHECK(out[5] == (300 >> 8));
    CHECK(out.size() == FRAME_MIN_SIZE + 300);
}

TEST_CASE("Bodies above 65535 bytes are refused") {
    std::vector<uint8_t> body(FRAME_MAX_BODY + 1, 0);
    std::vector<uint8_t> out;
    std::string err;
    CHECK_FALSE(encode_frame(FrameKind::Command, body, out, err));
    CHECK(err == "body_too_large");
}

TEST_CASE("Short input needs more data, unknown header is invalid") {
    Frame f;
    std::size_t used = 0;

    CHECK(decode_frame(kConfigDisableFrame.data(), 3, f, used) == DecodeStatus::NeedMoreData);
    CHECK(decode_frame(kConfigDisableFrame.data(), 5, f, used) == DecodeStatus::NeedMoreData);
    CHECK(decode_frame(kConfigDisableFrame.data(), 11, f, used) == DecodeStatus::NeedMoreData);

    const std::vector<uint8_t> junk = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09};
    CHECK(decode_frame(junk.data(), junk.size(), f, used) == DecodeStatus::Invalid);
    CHECK(used == 0);
}

TEST_CASE("Declared length is not trusted beyond the bytes present") {
    // header claims 200 bytes of body, only 6 bytes follow
    std::vector<uint8_t> raw = {0xFD, 0xFC, 0xFB, 0xFA, 0xC8, 0x00, 0x01, 0x02, 0x04, 0x03, 0x02, 0x01};
    Frame f;
    std::size_t used = 0;
    CHECK(decode_frame(raw.data(), raw.size(), f, used) == DecodeStatus::NeedMoreData);
}

TEST_CASE("Footer of the other kind, or a wrong footer, is invalid") {
    std::vector<uint8_t> raw = kConfigDisableFrame;
    raw[8] = 0xF8; raw[9] = 0xF7; raw[10] = 0xF6; raw[11] = 0xF5;   // report footer on a command frame
    Frame f;
    std::size_t used = 0;
    CHECK(decode_frame(raw.data(), raw.size(), f, used) == DecodeStatus::Invalid);

    raw = kConfigDisableFrame;
    raw[11] = 0x00;
    CHECK(decode_frame(raw.data(), raw.size(), f, used) == DecodeStatus::Invalid);
}

TEST_CASE("find_header reports the earliest header of either kind") {
    std::vector<uint8_t> raw = {0x11, 0x22, 0xF4, 0xF3, 0xF2, 0xF1, 0xFD, 0xFC, 0xFB, 0xFA};
    std::size_t off = 99;
    REQUIRE(find_header(raw.data(), raw.size(), off));
    CHECK(off == 2);

    std::vector<uint8_t> split = {0x00, 0xFD, 0xFC, 0xFB};
    CHECK_FALSE(find_header(split.data(), split.size(), off));
}
