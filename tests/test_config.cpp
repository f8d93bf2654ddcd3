#include <doctest/doctest.h>
#include "ld2410/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace ld2410;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / ("ld2410-test-" + std::to_string(::getpid()));
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST_CASE("Defaults") {
    DeviceConfig cfg;
    CHECK(cfg.device.empty());
    CHECK(cfg.baudrate == 256000);
    REQUIRE(cfg.command_timeout.has_value());
    CHECK(*cfg.command_timeout == 2000ms);
}

TEST_CASE("parse_config applies known keys") {
    DeviceConfig cfg;
    std::string err;
    REQUIRE(parse_config(R"({"device":"/dev/ttyUSB1","baudrate":115200,"command_timeout_ms":500,
                             "read_chunk":256,"poll_interval_ms":20})", cfg, err));
    CHECK(cfg.device == "/dev/ttyUSB1");
    CHECK(cfg.baudrate == 115200);
    CHECK(*cfg.command_timeout == 500ms);
    CHECK(cfg.read_chunk == 256);
    CHECK(cfg.poll_interval_ms == 20);
}

TEST_CASE("A zero or null timeout means wait forever") {
    DeviceConfig cfg;
    std::string err;
    REQUIRE(parse_config(R"({"command_timeout_ms":0})", cfg, err));
    CHECK_FALSE(cfg.command_timeout.has_value());

    cfg.command_timeout = 100ms;
    REQUIRE(parse_config(R"({"command_timeout_ms":null})", cfg, err));
    CHECK_FALSE(cfg.command_timeout.has_value());
}

TEST_CASE("A bad value leaves the config untouched") {
    DeviceConfig cfg;
    std::string err;
    CHECK_FALSE(parse_config(R"({"device":"/dev/x","baudrate":"fast"})", cfg, err));
    CHECK(err == "bad_config:baudrate");
    CHECK(cfg.device.empty());

    CHECK_FALSE(parse_config(R"({"command_timeout_ms":-5})", cfg, err));
    CHECK(err == "bad_config:command_timeout_ms");

    CHECK_FALSE(parse_config("{not json", cfg, err));
    CHECK(err == "bad_config:parse");

    CHECK_FALSE(parse_config("[1,2]", cfg, err));
    CHECK(err == "bad_config:parse");
}

TEST_CASE("load_config ignores a missing file and reads an existing one") {
    const fs::path dir = scratch_dir();
    DeviceConfig cfg;
    std::string err;
    CHECK(load_config((dir / "absent.json").string(), cfg, err));
    CHECK(cfg.device.empty());

    const fs::path file = dir / "config.json";
    {
        std::ofstream out(file);
        out << R"({"device":"/dev/ttyAMA0"})";
    }
    REQUIRE(load_config(file.string(), cfg, err));
    CHECK(cfg.device == "/dev/ttyAMA0");

    fs::remove_all(dir);
}

TEST_CASE("default_config_path follows XDG_CONFIG_HOME") {
    const char* old = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = old ? old : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    CHECK(default_config_path() == "/tmp/xdg-test/ld2410/config.json");

    if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else     ::unsetenv("XDG_CONFIG_HOME");
}
