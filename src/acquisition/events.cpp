#include "acquisition/events.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>

namespace benchlog {

const char* event_type_name(EventType t) {
    switch (t) {
        case EventType::MeasurementRecorded: return "measurement";
        case EventType::DeviceError:         return "error";
        case EventType::DeviceConnected:     return "connected";
        case EventType::DeviceDisconnected:  return "disconnected";
    }
    return "unknown";
}

Event make_measurement_event(const Measurement& m) {
    Event e;
    e.type = EventType::MeasurementRecorded;
    e.timestamp = m.timestamp;
    e.device_name = m.device_name;
    e.measurement = m;
    return e;
}

Event make_device_event(EventType type, const std::string& device, const std::string& message) {
    Event e;
    e.type = type;
    e.timestamp = now_timestamp();
    e.device_name = device;
    e.message = message;
    return e;
}

// --- EventBus ---

void EventBus::subscribe(EventSink* sink) {
    if (!sink) return;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
        sinks_.push_back(sink);
    }
}

void EventBus::unsubscribe(EventSink* sink) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void EventBus::publish(const Event& e) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto* sink : sinks_) {
        sink->on_event(e);
    }
}

size_t EventBus::subscriber_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sinks_.size();
}

// --- ConsoleEventLog ---

void ConsoleEventLog::on_event(const Event& e) {
    switch (e.type) {
        case EventType::MeasurementRecorded:
            if (verbose_) {
                const Measurement& m = e.measurement;
                std::printf("  [DATA] %s: %.9g %s [%s]\n",
                            m.device_name.c_str(), m.value, m.unit.c_str(),
                            status_name(m.status));
            }
            break;
        case EventType::DeviceError:
            std::fprintf(stderr, "  [ERROR] %s: %s\n",
                         e.device_name.c_str(), e.message.c_str());
            break;
        case EventType::DeviceConnected:
            std::printf("  [DEVICE] %s connected: %s\n",
                        e.device_name.c_str(), e.message.c_str());
            break;
        case EventType::DeviceDisconnected:
            std::printf("  [DEVICE] %s disconnected\n", e.device_name.c_str());
            break;
    }
}

} // namespace benchlog
