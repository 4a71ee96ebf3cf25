#include "instrument/command_table.hpp"

#include <cctype>
#include <cstring>

namespace benchlog {

static const FunctionInfo FUNCTIONS[NUM_FUNCTIONS] = {
    {Function::DC_VOLTAGE, "DC Voltage", "MEAS:VOLT:DC?", "CONF:VOLT:DC",
     "V", "Measure DC voltage",
     {"AUTO", "0.1", "1", "10", "100", "1000", nullptr, nullptr}},
    {Function::AC_VOLTAGE, "AC Voltage", "MEAS:VOLT:AC?", "CONF:VOLT:AC",
     "V", "Measure AC voltage",
     {"AUTO", "0.1", "1", "10", "100", "750", nullptr, nullptr}},
    {Function::DC_CURRENT, "DC Current", "MEAS:CURR:DC?", "CONF:CURR:DC",
     "A", "Measure DC current",
     {"AUTO", "0.001", "0.01", "0.1", "1", "3", nullptr, nullptr}},
    {Function::AC_CURRENT, "AC Current", "MEAS:CURR:AC?", "CONF:CURR:AC",
     "A", "Measure AC current",
     {"AUTO", "0.001", "0.01", "0.1", "1", "3", nullptr, nullptr}},
    {Function::RESISTANCE_2W, "Resistance (2-wire)", "MEAS:RES?", "CONF:RES",
     "\xCE\xA9", "Measure resistance (2-wire)",
     {"AUTO", "100", "1K", "10K", "100K", "1M", "10M", "100M"}},
    {Function::RESISTANCE_4W, "Resistance (4-wire)", "MEAS:FRES?", "CONF:FRES",
     "\xCE\xA9", "Measure resistance (4-wire)",
     {"AUTO", "100", "1K", "10K", "100K", "1M", "10M", "100M"}},
    {Function::FREQUENCY, "Frequency", "MEAS:FREQ?", "CONF:FREQ",
     "Hz", "Measure frequency",
     {"AUTO", "1", "10", "100", "1K", "10K", "100K", "1M"}},
    // Temperature "ranges" select the probe type
    {Function::TEMPERATURE, "Temperature", "MEAS:TEMP?", "CONF:TEMP",
     "\xC2\xB0" "C", "Measure temperature",
     {"AUTO", "RTD", "THERMISTOR", "THERMOCOUPLE", nullptr, nullptr, nullptr, nullptr}},
};

struct CommonCommand {
    const char* name;
    const char* command;
};

static const CommonCommand COMMON_COMMANDS[] = {
    {"Reset",              CMD_RESET},
    {"Clear Status",       CMD_CLEAR_STATUS},
    {"Self Test",          CMD_SELF_TEST},
    {"Identification",     CMD_IDENTIFY},
    {"Operation Complete", CMD_OP_COMPLETE},
    {"Wait",               CMD_WAIT},
};

static bool iequals(const std::string& a, const char* b) {
    size_t n = std::strlen(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const FunctionInfo* find_function(const std::string& name) {
    for (const auto& f : FUNCTIONS) {
        if (name == f.name) return &f;
    }
    return nullptr;
}

const FunctionInfo& function_info(Function f) {
    return FUNCTIONS[static_cast<int>(f)];
}

std::vector<std::string> function_names() {
    std::vector<std::string> names;
    names.reserve(NUM_FUNCTIONS);
    for (const auto& f : FUNCTIONS) {
        names.emplace_back(f.name);
    }
    return names;
}

std::vector<std::string> ranges_for(const std::string& function) {
    std::vector<std::string> out;
    const FunctionInfo* info = find_function(function);
    if (!info) return out;
    for (int i = 0; i < MAX_RANGES && info->ranges[i]; ++i) {
        out.emplace_back(info->ranges[i]);
    }
    return out;
}

std::string unit_for(const std::string& function) {
    const FunctionInfo* info = find_function(function);
    return info ? info->unit : "";
}

const char* common_command(const std::string& name) {
    for (const auto& c : COMMON_COMMANDS) {
        if (name == c.name) return c.command;
    }
    return nullptr;
}

Error resolve_command(const std::string& function, const std::string& range,
                      std::string& out) {
    const FunctionInfo* info = find_function(function);
    if (!info) {
        out.clear();
        return Error::UnknownFunction;
    }

    if (range.empty() || iequals(range, DEFAULT_RANGE)) {
        out = info->query;
        return Error::Ok;
    }

    // Range must be one of the table's tokens; use the table spelling
    const char* token = nullptr;
    for (int i = 1; i < MAX_RANGES && info->ranges[i]; ++i) {
        if (iequals(range, info->ranges[i])) {
            token = info->ranges[i];
            break;
        }
    }
    if (!token) {
        out = info->query;
        return Error::InvalidRange;
    }

    out = info->configure;
    out += ' ';
    out += token;
    out += READ_SUFFIX;
    return Error::Ok;
}

} // namespace benchlog
