#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace benchlog {

// Defaults for the acquisition / display / export knobs
constexpr int    DEFAULT_INTERVAL_MS  = 1000;
constexpr double DEFAULT_TIMEOUT_SEC  = 5.0;
constexpr size_t DEFAULT_MAX_POINTS   = 1000;
constexpr int    DEFAULT_WINDOW_SEC   = 600;   // 10 minutes, 0 = no window
constexpr const char* DEFAULT_RANGE   = "AUTO";

// Wall-clock time truncated to microseconds (the export precision)
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

inline Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

enum class MeasurementStatus : uint8_t {
    Ok,
    Error,
};

inline const char* status_name(MeasurementStatus s) {
    return s == MeasurementStatus::Ok ? "OK" : "ERROR";
}

enum class ExportFormat : uint8_t {
    CSV,
    JSON,
    TXT,
};

// Configuration for a single instrument.
// Owned by the Registry; the scheduler only ever sees copies.
struct DeviceConfig {
    std::string name;               // Unique key
    std::string address;            // Transport locator, e.g. TCPIP0::10.0.0.5::5025::SOCKET
    std::string function;           // Display name from the function table, e.g. "DC Voltage"
    std::string range = DEFAULT_RANGE;
    int         sample_count = 1;   // Readings averaged per measurement
    std::string user_label;
    std::string resolved_command;   // Filled by the registry from function + range
    bool        enabled = true;
};

// One acquired reading. Never modified after creation: user_label, function
// and unit are snapshots of the config at acquisition time.
struct Measurement {
    Timestamp         timestamp;
    std::string       device_name;
    std::string       function;
    double            value = 0.0;
    std::string       unit;
    MeasurementStatus status = MeasurementStatus::Ok;
    std::string       user_label;
};

// One point of the recent-history cache
struct SeriesPoint {
    Timestamp timestamp;
    double    value;
};

// Process-level settings (populated from the command line)
struct Settings {
    int          interval_ms   = DEFAULT_INTERVAL_MS;
    double       timeout_sec   = DEFAULT_TIMEOUT_SEC;
    size_t       max_points    = DEFAULT_MAX_POINTS;
    int          window_sec    = DEFAULT_WINDOW_SEC;
    ExportFormat export_format = ExportFormat::CSV;
};

} // namespace benchlog
