#pragma once

#include "acquisition/events.hpp"
#include "instrument/types.hpp"
#include "storage/history_ring.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace benchlog {

// Session log + per-device recent-history cache.
//
// The log is append-only and unbounded for the process lifetime. The cache
// keeps at most max_points OK points per device, oldest evicted first.
// All access goes through one shared_mutex: appends take it exclusive, every
// read copies what it needs under a shared lock, so callers (export,
// statistics, the feed) always work on a consistent snapshot.
class MeasurementStore : public EventSink {
public:
    explicit MeasurementStore(size_t max_points = DEFAULT_MAX_POINTS);

    // EventSink: records MeasurementRecorded events, ignores the rest
    void on_event(const Event& e) override;

    void record(const Measurement& m);

    // Log entries in arrival order, optionally for one device, optionally only
    // the latest `limit` of them.
    std::vector<Measurement> query(const std::optional<std::string>& device = std::nullopt,
                                   const std::optional<size_t>& limit = std::nullopt) const;

    // Most recent log entry per device name
    std::map<std::string, Measurement> latest_per_device() const;

    // Cached points for one device, optionally only those with
    // timestamp >= now - window. Never modifies the cache.
    std::vector<SeriesPoint> recent_series(
        const std::string& device,
        const std::optional<std::chrono::seconds>& window = std::nullopt) const;

    // recent_series() for every device with cached points
    std::map<std::string, std::vector<SeriesPoint>> recent_all(
        const std::optional<std::chrono::seconds>& window = std::nullopt) const;

    // Devices with cached points
    std::vector<std::string> device_names() const;

    // No device: empty the log and every cache. With a device: drop only
    // that device's log entries and cache.
    void clear(const std::optional<std::string>& device = std::nullopt);

    // Full copy of the log
    std::vector<Measurement> snapshot() const;

    size_t size() const;
    size_t max_points() const { return max_points_; }

private:
    size_t max_points_;

    mutable std::shared_mutex mutex_;
    std::vector<Measurement> log_;
    std::map<std::string, HistoryRing<SeriesPoint>> cache_;
};

// Convert a display window in seconds (0 = no window) to the optional form
inline std::optional<std::chrono::seconds> window_from_seconds(int sec) {
    if (sec <= 0) return std::nullopt;
    return std::chrono::seconds(sec);
}

} // namespace benchlog
