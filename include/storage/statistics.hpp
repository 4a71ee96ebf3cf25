#pragma once

#include "instrument/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace benchlog {

class MeasurementStore;

struct TimeRange {
    Timestamp start;
    Timestamp end;
    double    duration_sec;
};

// Over OK records only
struct DeviceStats {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double last_value = 0.0;
};

// Summary of a set of measurements. count/devices/functions/time_range
// cover every matching record, per_device only the OK ones.
// Empty input gives count 0, empty sets and no time range.
struct SessionStats {
    size_t count = 0;
    std::set<std::string> devices;
    std::set<std::string> functions;
    std::optional<TimeRange> time_range;
    std::map<std::string, DeviceStats> per_device;
};

SessionStats compute_stats(const std::vector<Measurement>& records,
                           const std::optional<std::string>& device = std::nullopt);

// Works on a snapshot of the store's log
SessionStats compute_stats(const MeasurementStore& store,
                           const std::optional<std::string>& device = std::nullopt);

// Live-display statistics over a recent-history series
struct SeriesStats {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double stddev = 0.0;    // Population standard deviation
};

SeriesStats series_stats(const std::vector<SeriesPoint>& points);

SeriesStats series_stats(const MeasurementStore& store, const std::string& device,
                         const std::optional<std::chrono::seconds>& window = std::nullopt);

void print_session_stats(const SessionStats& s);

} // namespace benchlog
