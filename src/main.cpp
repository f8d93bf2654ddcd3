/**
 * @file main.cpp
 * @brief ld2410-cli: one-shot runner around ld2410::Device.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); exactly one action per run.
 *  - Layer settings: built-in defaults, then the JSON config file, then flags.
 *  - Connect, run the action inside a configuration session (or read reports),
 *    print one "status=ok k=v ..." line per result, or JSON with --format json.
 *
 * Exit codes: 0 ok, 1 link, 2 usage, 3 timeout, 4 command failed, 5 protocol.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "command_dispatch.hpp"      // name_to_kind(), run_command(), format_fields()
#include "ld2410/config.hpp"         // DeviceConfig, load_config()
#include "ld2410/device.hpp"         // Device
#include "ld2410/logging.hpp"        // Logger

using json = nlohmann::json;

// Exit codes, stable for scripts.
static constexpr int EXIT_OK         = 0;
static constexpr int EXIT_LINK       = 1;   // open failed / connection lost
static constexpr int EXIT_USAGE      = 2;   // bad arguments or values
static constexpr int EXIT_TIMEOUT    = 3;
static constexpr int EXIT_CMD_FAILED = 4;   // module answered with a failure status
static constexpr int EXIT_PROTOCOL   = 5;   // unexpected reply content

static int exit_code_for(const ld2410::Error& err) {
  using ld2410::ErrorCode;
  switch (err.code) {
    case ErrorCode::None:             return EXIT_OK;
    case ErrorCode::BadParameter:     return EXIT_USAGE;
    case ErrorCode::Timeout:          return EXIT_TIMEOUT;
    case ErrorCode::CommandFailed:    return EXIT_CMD_FAILED;
    case ErrorCode::BadReply:
    case ErrorCode::WrongContext:
    case ErrorCode::ModuleRestarted:  return EXIT_PROTOCOL;
    default:                          return EXIT_LINK;
  }
}

static void print_fields(const ld2410::Fields& fields, bool as_json) {
  if (!as_json) {
    std::cout << ld2410::format_fields(fields) << "\n";
    return;
  }
  json j = json::object();
  j["status"] = "ok";
  for (const auto& kv : fields) j[kv.first] = kv.second;
  std::cout << j.dump() << "\n";
}

static int print_error(const std::string& reason, int code, bool as_json) {
  if (as_json) {
    json j = {{"status", "error"}, {"reason", reason}};
    std::cerr << j.dump() << "\n";
  } else {
    std::cerr << "status=error reason=" << reason << "\n";
  }
  return code;
}

int main(int argc, char** argv) {
  CLI::App app{"LD2410 presence radar CLI"};

  std::string config_path = ld2410::default_config_path();
  std::string dev;
  uint32_t baud = 0;
  int timeout_ms = -1;

  std::string get_name;                 // --get <name>
  std::vector<std::string> set_kv;      // --set <name> <value>
  bool do_restart = false, do_factory_reset = false;
  int report_count = 0;

  std::string format = "pretty";
  bool verbose = false, trace = false;

  app.add_option("--config", config_path, "JSON config file (default $XDG_CONFIG_HOME/ld2410/config.json)");
  CLI::Option* opt_dev  = app.add_option("--dev", dev, "Serial device (e.g. /dev/ttyUSB0)");
  CLI::Option* opt_baud = app.add_option("--baud", baud, "Serial baud rate (default 256000)");
  CLI::Option* opt_tmo  = app.add_option("--timeout", timeout_ms, "Command timeout in ms, 0 = wait forever")
                             ->check(CLI::Range(0, 600000));

  app.add_option("--get", get_name, "Get: fw|mac|resolution|all");
  app.add_option("--set", set_kv, "Set: --set <baud|resolution|bluetooth|bt_password|engineering> <value>")
     ->expected(2);
  app.add_flag("--restart", do_restart, "Restart the module");
  app.add_flag("--factory-reset", do_factory_reset, "Restore factory configuration");
  app.add_option("--reports", report_count, "Print the next N radar reports")->check(CLI::PositiveNumber);

  app.add_option("--format", format, "Output format")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("-v,--verbose", verbose, "Log protocol events to stderr");
  app.add_flag("--trace", trace, "Also log raw bytes");

  CLI11_PARSE(app, argc, argv);

  const bool as_json = (format == "json");
  auto& log = ld2410::Logger::instance();
  log.set_level(trace ? ld2410::LogLevel::TRACE
                      : verbose ? ld2410::LogLevel::DEBUG : ld2410::LogLevel::WARN);

  // -------- exactly one action --------
  int actions = 0;
  actions += get_name.empty() ? 0 : 1;
  actions += (set_kv.size() == 2) ? 1 : 0;
  actions += do_restart ? 1 : 0;
  actions += do_factory_reset ? 1 : 0;
  actions += report_count > 0 ? 1 : 0;
  if (actions != 1) return print_error("need_exactly_one_command", EXIT_USAGE, as_json);

  // -------- settings: defaults < file < flags --------
  ld2410::DeviceConfig cfg;
  std::string cfg_err;
  if (!ld2410::load_config(config_path, cfg, cfg_err))
    return print_error(cfg_err, EXIT_USAGE, as_json);
  if (opt_dev->count())  cfg.device = dev;
  if (opt_baud->count()) cfg.baudrate = baud;
  if (opt_tmo->count()) {
    if (timeout_ms == 0) cfg.command_timeout.reset();
    else                 cfg.command_timeout = std::chrono::milliseconds(timeout_ms);
  }
  if (cfg.device.empty()) return print_error("no_device", EXIT_USAGE, as_json);

  // -------- resolve the command before touching the port --------
  ld2410::CommandKind kind = ld2410::CommandKind::GET_ALL;
  std::string value;
  if (!get_name.empty()) {
    if (!ld2410::name_to_kind(get_name, false, kind))
      return print_error("unknown_get:" + get_name, EXIT_USAGE, as_json);
  } else if (set_kv.size() == 2) {
    if (!ld2410::name_to_kind(set_kv[0], true, kind) || !ld2410::kind_needs_value(kind))
      return print_error("unknown_set:" + set_kv[0], EXIT_USAGE, as_json);
    value = set_kv[1];
  } else if (do_restart) {
    kind = ld2410::CommandKind::RESTART;
  } else if (do_factory_reset) {
    kind = ld2410::CommandKind::FACTORY_RESET;
  }

  // -------- connect --------
  ld2410::Device device(cfg);
  ld2410::Error err;
  if (!device.connect(err)) return print_error(err.reason, exit_code_for(err), as_json);

  // -------- reports --------
  if (report_count > 0) {
    const auto wait = cfg.command_timeout.value_or(std::chrono::milliseconds(0));
    for (int i = 0; i < report_count; ++i) {
      ld2410::ReportStatus report;
      const ld2410::ReportWait got = (wait.count() > 0) ? device.wait_next_report_for(wait, report)
                                                        : device.wait_next_report(report);
      if (got != ld2410::ReportWait::Report) {
        device.disconnect();
        return got == ld2410::ReportWait::Timeout ? print_error("timeout", EXIT_TIMEOUT, as_json)
                                                  : print_error("device_disconnected", EXIT_LINK, as_json);
      }
      print_fields(ld2410::report_fields(report), as_json);
    }
    device.disconnect();
    return EXIT_OK;
  }

  // -------- one command --------
  ld2410::Fields fields;
  if (!ld2410::run_command(device, kind, value, fields, err)) {
    device.disconnect();
    return print_error(err.reason, exit_code_for(err), as_json);
  }
  print_fields(fields, as_json);
  device.disconnect();
  return EXIT_OK;
}
