#pragma once

#include "instrument/errors.hpp"
#include "instrument/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace benchlog {

// Measurement functions supported by the command table
enum class Function : uint8_t {
    DC_VOLTAGE,
    AC_VOLTAGE,
    DC_CURRENT,
    AC_CURRENT,
    RESISTANCE_2W,
    RESISTANCE_4W,
    FREQUENCY,
    TEMPERATURE,
};

constexpr int NUM_FUNCTIONS = 8;
constexpr int MAX_RANGES    = 8;

// Static description of one function. The query and configure forms are both
// spelled out here; nothing is derived from the other by string substitution.
struct FunctionInfo {
    Function    id;
    const char* name;         // Display name, e.g. "DC Voltage"
    const char* query;        // Autorange reading, e.g. "MEAS:VOLT:DC?"
    const char* configure;    // Configure verb form, e.g. "CONF:VOLT:DC"
    const char* unit;
    const char* description;
    const char* ranges[MAX_RANGES];  // First entry is always "AUTO", unused slots nullptr
};

// IEEE 488.2 common commands
constexpr const char* CMD_IDENTIFY      = "*IDN?";
constexpr const char* CMD_RESET         = "*RST";
constexpr const char* CMD_CLEAR_STATUS  = "*CLS";
constexpr const char* CMD_SELF_TEST     = "*TST?";
constexpr const char* CMD_OP_COMPLETE   = "*OPC?";
constexpr const char* CMD_WAIT          = "*WAI";

// Suffix appended to a configure command so the instrument returns a reading
constexpr const char* READ_SUFFIX = ";:READ?";

// Lookup by display name (exact match). Returns nullptr if unknown.
const FunctionInfo* find_function(const std::string& name);

// Lookup by enum
const FunctionInfo& function_info(Function f);

std::vector<std::string> function_names();

// Valid range tokens for a function ("AUTO" first). Empty if unknown.
std::vector<std::string> ranges_for(const std::string& function);

// Unit for a function, "" if unknown
std::string unit_for(const std::string& function);

// Common command by name ("Reset", "Identification", ...). nullptr if unknown.
const char* common_command(const std::string& name);

// Derive the command string sent on every tick for (function, range).
//   range empty or AUTO -> the function's query, unchanged
//   any other range     -> "<configure> <range>;:READ?"
// Pure: no state, no I/O, no session required.
// Errors:
//   UnknownFunction -> out = "" (caller must treat the device as unconfigured)
//   InvalidRange    -> out = the autorange query (usable fallback)
Error resolve_command(const std::string& function, const std::string& range,
                      std::string& out);

} // namespace benchlog
