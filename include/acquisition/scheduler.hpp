#pragma once

#include "instrument/errors.hpp"
#include "instrument/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace benchlog {

class DeviceWorker;
class EventBus;
class InstrumentRegistry;
struct Event;

// Parse an instrument reply as a finite 64-bit float. Surrounding whitespace
// is allowed; anything else left over makes the parse fail.
bool parse_reading(const std::string& raw, double& value);

// Periodic polling of every enabled + connected device.
//
// Idle -> start(interval) -> Running -> stop() -> Idle.
// A tick thread fires every interval (monotonic, first tick immediately),
// reads the registry's active devices fresh, and triggers one DeviceWorker
// per device. Results reach consumers only as events on the EventBus; the
// scheduler holds no measurement data.
class AcquisitionScheduler {
public:
    AcquisitionScheduler(InstrumentRegistry& registry, EventBus& bus,
                         double timeout_sec = DEFAULT_TIMEOUT_SEC);
    ~AcquisitionScheduler();

    AcquisitionScheduler(const AcquisitionScheduler&) = delete;
    AcquisitionScheduler& operator=(const AcquisitionScheduler&) = delete;

    // NoDevicesConfigured if nothing is active right now, ConfigError for a
    // non-positive interval. While running: only updates the interval.
    Error start(int interval_ms);

    // Once this returns no further event from an in-flight poll is
    // published. Outstanding queries are left to finish; their results are
    // discarded. No-op while idle.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }
    int interval_ms() const { return interval_ms_.load(std::memory_order_acquire); }
    double timeout_sec() const { return timeout_sec_; }

    struct Stats {
        uint64_t ticks;
        uint64_t overruns;          // Device skipped: previous poll still outstanding
        uint64_t measurements;      // Published (OK + ERROR)
        uint64_t parse_errors;
        uint64_t query_failures;
        uint64_t discarded;         // Results dropped because of stop()
        double   min_dispatch_ms;
        double   mean_dispatch_ms;
        double   max_dispatch_ms;
        double   runtime_sec;
    };

    Stats get_stats() const;
    void print_stats() const;

    // Called on a DeviceWorker thread
    void poll_device(DeviceWorker& worker, const DeviceConfig& config, double timeout_sec);

private:
    void tick_loop();
    void run_tick();
    void deliver(const DeviceWorker& worker, const Event& e);

    // Join retired workers that have exited (all of them if wait)
    void reap_retired(bool wait);

    InstrumentRegistry& registry_;
    EventBus& bus_;
    double timeout_sec_;

    std::mutex control_mutex_;          // Serializes start/stop
    std::atomic<bool> running_;
    std::atomic<int> interval_ms_;

    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;
    bool stop_requested_;
    bool reschedule_;                   // Interval changed while waiting
    std::thread tick_thread_;

    // Touched by the tick thread while running, by stop() after the join
    std::map<std::string, std::unique_ptr<DeviceWorker>> workers_;
    std::vector<std::unique_ptr<DeviceWorker>> retired_;

    // Publishing holds this shared; stop() takes it exclusive to flip accepting_
    std::shared_mutex emit_mutex_;
    bool accepting_;

    // Statistics
    std::atomic<uint64_t> ticks_;
    std::atomic<uint64_t> overruns_;
    std::atomic<uint64_t> measurements_;
    std::atomic<uint64_t> parse_errors_;
    std::atomic<uint64_t> query_failures_;
    std::atomic<uint64_t> discarded_;

    mutable std::mutex stats_mutex_;
    double dispatch_sum_ms_;
    double min_dispatch_ms_;
    double max_dispatch_ms_;
    double start_time_;

    static constexpr double STATS_INTERVAL_SEC = 10.0;
    double last_stats_time_;
};

} // namespace benchlog
