#include <doctest/doctest.h>
#include "ld2410/commands.hpp"

#include <string>
#include <vector>

using namespace ld2410;

TEST_CASE("Every supported baud rate maps to its wire index") {
    const uint32_t rates[] = {9600, 19200, 38400, 57600, 115200, 230400, 256000, 460800};
    for (uint16_t i = 0; i < 8; ++i) {
        std::vector<uint8_t> payload;
        Error err;
        REQUIRE(make_set_baud_rate(rates[i], payload, err));
        CHECK(payload == std::vector<uint8_t>{static_cast<uint8_t>(i + 1), 0x00});
    }
}

TEST_CASE("Unsupported baud rates are a bad parameter") {
    std::vector<uint8_t> payload;
    Error err;
    CHECK_FALSE(make_set_baud_rate(12345, payload, err));
    CHECK(err.code == ErrorCode::BadParameter);
    CHECK(err.reason == "bad_value:baud_rate");
    CHECK(err.opcode == 0xA1);
    CHECK(payload.empty());
}

TEST_CASE("Distance resolution accepts 20 and 75 cm only") {
    std::vector<uint8_t> payload;
    Error err;
    REQUIRE(make_set_distance_resolution(75, payload, err));
    CHECK(payload == std::vector<uint8_t>{0x00, 0x00});
    REQUIRE(make_set_distance_resolution(20, payload, err));
    CHECK(payload == std::vector<uint8_t>{0x01, 0x00});

    CHECK_FALSE(make_set_distance_resolution(50, payload, err));
    CHECK(err.code == ErrorCode::BadParameter);
}

TEST_CASE("Bluetooth password is padded to six bytes") {
    std::vector<uint8_t> payload;
    Error err;
    REQUIRE(make_set_bluetooth_password("abc", payload, err));
    CHECK(payload == std::vector<uint8_t>{'a', 'b', 'c', 0, 0, 0});

    REQUIRE(make_set_bluetooth_password("HiLink", payload, err));
    CHECK(payload == std::vector<uint8_t>{'H', 'i', 'L', 'i', 'n', 'k'});
}

TEST_CASE("Bluetooth password longer than six or non-ASCII is refused") {
    std::vector<uint8_t> payload;
    Error err;
    CHECK_FALSE(make_set_bluetooth_password("toolong", payload, err));
    CHECK(err.reason == "bad_value:bt_password");

    err.clear();
    CHECK_FALSE(make_set_bluetooth_password("p\xc3\xa9", payload, err));
    CHECK(err.code == ErrorCode::BadParameter);
}

TEST_CASE("Simple payloads") {
    CHECK(make_config_enable() == std::vector<uint8_t>{0x01, 0x00});
    CHECK(make_get_bluetooth_address() == std::vector<uint8_t>{0x01, 0x00});
    CHECK(make_set_bluetooth_mode(true)  == std::vector<uint8_t>{0x01, 0x00});
    CHECK(make_set_bluetooth_mode(false) == std::vector<uint8_t>{0x00, 0x00});
}

TEST_CASE("Firmware version reply: big-endian type, minor before major") {
    const std::vector<uint8_t> payload = {0x00, 0x01, 0x04, 0x02, 0x16, 0x24, 0x06, 0x22};
    FirmwareVersion fw;
    Error err;
    REQUIRE(decode_firmware_version(payload, fw, err));
    CHECK(fw.type == 0x0001);
    CHECK(fw.major == 2);
    CHECK(fw.minor == 4);
    CHECK(fw.revision == 0x22062416);
    CHECK(encode_firmware_version(fw) == payload);

    CHECK_FALSE(decode_firmware_version({0x00, 0x01}, fw, err));
    CHECK(err.code == ErrorCode::BadReply);
}

TEST_CASE("Config mode and address replies") {
    ConfigModeStatus st;
    Error err;
    REQUIRE(decode_config_mode({0x01, 0x00, 0x40, 0x00}, st, err));
    CHECK(st.protocol_version == 1);
    CHECK(st.buffer_size == 64);

    BluetoothAddress addr{};
    REQUIRE(decode_bluetooth_address({0x8f, 0x27, 0x2e, 0xb8, 0x0f, 0x65}, addr, err));
    CHECK(format_address(addr) == "8f:27:2e:b8:0f:65");
}

TEST_CASE("Unknown distance resolution index is a bad reply") {
    uint16_t cm = 0;
    Error err;
    REQUIRE(decode_distance_resolution({0x01, 0x00}, cm, err));
    CHECK(cm == 20);

    CHECK_FALSE(decode_distance_resolution({0x05, 0x00}, cm, err));
    CHECK(err.code == ErrorCode::BadReply);
    CHECK(err.reason == "bad_reply:distance_resolution");
}
