#include "storage/measurement_store.hpp"

#include <mutex>

namespace benchlog {

static void filter_window(const HistoryRing<SeriesPoint>& ring,
                          const std::optional<std::chrono::seconds>& window,
                          Timestamp now, std::vector<SeriesPoint>& out) {
    out.clear();
    if (!window) {
        out = ring.to_vector();
        return;
    }
    const Timestamp cutoff = now - *window;
    for (size_t i = 0; i < ring.size(); ++i) {
        if (ring[i].timestamp >= cutoff) {
            out.push_back(ring[i]);
        }
    }
}

MeasurementStore::MeasurementStore(size_t max_points)
    : max_points_(max_points > 0 ? max_points : 1)
{}

void MeasurementStore::on_event(const Event& e) {
    if (e.type == EventType::MeasurementRecorded) {
        record(e.measurement);
    }
}

void MeasurementStore::record(const Measurement& m) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    log_.push_back(m);

    if (m.status == MeasurementStatus::Ok) {
        auto it = cache_.find(m.device_name);
        if (it == cache_.end()) {
            it = cache_.emplace(m.device_name, HistoryRing<SeriesPoint>(max_points_)).first;
        }
        it->second.push(SeriesPoint{m.timestamp, m.value});
    }
}

std::vector<Measurement> MeasurementStore::query(const std::optional<std::string>& device,
                                                 const std::optional<size_t>& limit) const {
    std::vector<Measurement> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!device) {
            out = log_;
        } else {
            for (const auto& m : log_) {
                if (m.device_name == *device) out.push_back(m);
            }
        }
    }

    if (limit && out.size() > *limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(*limit));
    }
    return out;
}

std::map<std::string, Measurement> MeasurementStore::latest_per_device() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, Measurement> out;
    for (const auto& m : log_) {
        out[m.device_name] = m;
    }
    return out;
}

std::vector<SeriesPoint> MeasurementStore::recent_series(
    const std::string& device, const std::optional<std::chrono::seconds>& window) const {
    const Timestamp now = now_timestamp();
    std::vector<SeriesPoint> out;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(device);
    if (it != cache_.end()) {
        filter_window(it->second, window, now, out);
    }
    return out;
}

std::map<std::string, std::vector<SeriesPoint>> MeasurementStore::recent_all(
    const std::optional<std::chrono::seconds>& window) const {
    const Timestamp now = now_timestamp();
    std::map<std::string, std::vector<SeriesPoint>> out;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& kv : cache_) {
        filter_window(kv.second, window, now, out[kv.first]);
    }
    return out;
}

std::vector<std::string> MeasurementStore::device_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& kv : cache_) {
        out.push_back(kv.first);
    }
    return out;
}

void MeasurementStore::clear(const std::optional<std::string>& device) {
    if (!device) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        log_.clear();
        cache_.clear();
        return;
    }

    // Build the filtered log first; the swap below cannot fail, so a
    // failed allocation leaves the store untouched.
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<Measurement> kept;
    kept.reserve(log_.size());
    for (const auto& m : log_) {
        if (m.device_name != *device) kept.push_back(m);
    }
    log_.swap(kept);
    cache_.erase(*device);
}

std::vector<Measurement> MeasurementStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return log_;
}

size_t MeasurementStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return log_.size();
}

} // namespace benchlog
