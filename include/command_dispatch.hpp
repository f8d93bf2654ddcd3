#pragma once
/**
 * @page ld2410-command-dispatch CLI Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Resolve `--get` / `--set` names into LD2410 client calls.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between ld2410-cli arguments and the Device
 * API. main.cpp never touches opcodes: it resolves a user-facing name into
 * a CommandKind, then hands it to run_command() together with the raw value
 * string.
 *
 * WHAT THIS DOES
 * --------------
 * - `name_to_kind()` maps names like `"fw"` or `"resolution"` (plus whether
 *   it is a GET or SET) onto a CommandKind. Synonyms are normalized here;
 *   read-only names have no SET form.
 * - `run_command()` opens a configuration session, parses and validates the
 *   value, performs the call and collects the result as key/value fields.
 *   Value errors come back as `bad_value:<name>` before any I/O.
 * - `format_fields()` renders `status=ok key=value ...` for shells.
 *
 * NAMES
 * -----
 *   GET: fw | firmware, mac | bt_address, resolution, all
 *   SET: baud <rate>, resolution <20|75>, bluetooth <on|off>,
 *        bt_password <text>, engineering <on|off>
 *   plus the actions factory_reset and restart (no value)
 *
 * EXAMPLE
 * -------
 *   ld2410::CommandKind kind;
 *   if (!ld2410::name_to_kind("resolution", true, kind)) return 2;
 *   ld2410::Fields fields;
 *   ld2410::Error err;
 *   if (!ld2410::run_command(dev, kind, "20", fields, err)) {
 *       std::cerr << "status=error reason=" << err.reason << "\n";
 *   }
 *   std::cout << ld2410::format_fields(fields) << "\n";   // status=ok resolution_cm=20
 */

#include "ld2410/device.hpp"
#include "ld2410/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ld2410 {

/**
 * @enum CommandKind
 * @brief Every operation the CLI can perform on the module.
 */
enum class CommandKind {
    GET_FW_VERSION,
    GET_BT_ADDRESS,
    GET_RESOLUTION,
    GET_ALL,          ///< firmware, address and resolution in one session

    SET_BAUD,
    SET_RESOLUTION,
    SET_BLUETOOTH,
    SET_BT_PASSWORD,
    SET_ENGINEERING,

    FACTORY_RESET,
    RESTART
};

using Fields = std::vector<std::pair<std::string, std::string>>;

bool name_to_kind(const std::string& raw_name, bool is_set, CommandKind& out_kind);

const char* kind_name(CommandKind kind);

/// True for kinds that take a value (all SET_* kinds).
bool kind_needs_value(CommandKind kind);

bool run_command(Device& dev, CommandKind kind, const std::string& value,
                 Fields& out, Error& err);

/// "status=ok k1=v1 k2=v2"
std::string format_fields(const Fields& fields);

/// Fields of one radar report, ready for format_fields().
Fields report_fields(const ReportStatus& report);

} // namespace ld2410
