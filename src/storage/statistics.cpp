#include "storage/statistics.hpp"
#include "storage/measurement_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace benchlog {

SessionStats compute_stats(const std::vector<Measurement>& records,
                           const std::optional<std::string>& device) {
    SessionStats s;
    std::map<std::string, double> sums;

    for (const auto& m : records) {
        if (device && m.device_name != *device) continue;

        s.count++;
        s.devices.insert(m.device_name);
        s.functions.insert(m.function);

        if (!s.time_range) {
            s.time_range = TimeRange{m.timestamp, m.timestamp, 0.0};
        } else {
            s.time_range->start = std::min(s.time_range->start, m.timestamp);
            s.time_range->end = std::max(s.time_range->end, m.timestamp);
        }

        if (m.status != MeasurementStatus::Ok) continue;

        DeviceStats& d = s.per_device[m.device_name];
        if (d.count == 0) {
            d.min = m.value;
            d.max = m.value;
        } else {
            d.min = std::min(d.min, m.value);
            d.max = std::max(d.max, m.value);
        }
        d.count++;
        d.last_value = m.value;
        sums[m.device_name] += m.value;
    }

    for (auto& kv : s.per_device) {
        kv.second.mean = sums[kv.first] / static_cast<double>(kv.second.count);
    }

    if (s.time_range) {
        s.time_range->duration_sec =
            std::chrono::duration<double>(s.time_range->end - s.time_range->start).count();
    }
    return s;
}

SessionStats compute_stats(const MeasurementStore& store,
                           const std::optional<std::string>& device) {
    return compute_stats(store.query(device), device);
}

SeriesStats series_stats(const std::vector<SeriesPoint>& points) {
    SeriesStats s;
    if (points.empty()) return s;

    s.count = points.size();
    s.min = points[0].value;
    s.max = points[0].value;
    double sum = 0.0;
    for (const auto& p : points) {
        s.min = std::min(s.min, p.value);
        s.max = std::max(s.max, p.value);
        sum += p.value;
    }
    s.mean = sum / static_cast<double>(s.count);

    double sq = 0.0;
    for (const auto& p : points) {
        double d = p.value - s.mean;
        sq += d * d;
    }
    s.stddev = std::sqrt(sq / static_cast<double>(s.count));
    return s;
}

SeriesStats series_stats(const MeasurementStore& store, const std::string& device,
                         const std::optional<std::chrono::seconds>& window) {
    return series_stats(store.recent_series(device, window));
}

void print_session_stats(const SessionStats& s) {
    std::printf("\n  === Session statistics ===\n");
    std::printf("  Records:   %zu\n", s.count);
    std::printf("  Devices:   %zu\n", s.devices.size());
    std::printf("  Functions: %zu\n", s.functions.size());
    if (s.time_range) {
        std::printf("  Duration:  %.1f s\n", s.time_range->duration_sec);
    }
    for (const auto& kv : s.per_device) {
        const DeviceStats& d = kv.second;
        std::printf("  %-16s n=%-6zu min=%-14.6g max=%-14.6g mean=%-14.6g last=%.6g\n",
                    kv.first.c_str(), d.count, d.min, d.max, d.mean, d.last_value);
    }
}

} // namespace benchlog
