#pragma once

#include "instrument/types.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace benchlog {

enum class EventType : uint8_t {
    MeasurementRecorded,   // measurement is valid
    DeviceError,           // message = failure description (raw reply for parse errors)
    DeviceConnected,       // message = instrument identity (*IDN? reply)
    DeviceDisconnected,
};

const char* event_type_name(EventType t);

struct Event {
    EventType   type;
    Timestamp   timestamp;
    std::string device_name;
    Measurement measurement;
    std::string message;
};

Event make_measurement_event(const Measurement& m);
Event make_device_event(EventType type, const std::string& device, const std::string& message);

// Consumer of acquisition / registry events.
// on_event() is called from scheduler worker threads and from whichever
// thread calls connect/disconnect; implementations must be thread-safe and
// must not block for long (a slow sink delays only the publishing device).
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const Event& e) = 0;
};

// Synchronous fan-out to subscribed sinks.
// unsubscribe() waits for in-flight deliveries, so a sink may be destroyed
// right after unsubscribing.
class EventBus {
public:
    void subscribe(EventSink* sink);
    void unsubscribe(EventSink* sink);
    void publish(const Event& e);

    size_t subscriber_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<EventSink*> sinks_;
};

// Prints connect/disconnect/error events to the console (errors to stderr).
// Measurements are printed only when verbose.
class ConsoleEventLog : public EventSink {
public:
    explicit ConsoleEventLog(bool verbose = false) : verbose_(verbose) {}
    void on_event(const Event& e) override;

private:
    bool verbose_;
};

} // namespace benchlog
