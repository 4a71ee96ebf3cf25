#include "acquisition/scheduler.hpp"
#include "acquisition/device_worker.hpp"
#include "acquisition/events.hpp"
#include "instrument/command_table.hpp"
#include "instrument/registry.hpp"
#include "transport/socket_io.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>

namespace benchlog {

bool parse_reading(const std::string& raw, double& value) {
    size_t begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return false;
    size_t end = raw.find_last_not_of(" \t\r\n");
    std::string text = raw.substr(begin, end - begin + 1);

    char* endp = nullptr;
    double v = std::strtod(text.c_str(), &endp);
    if (endp != text.c_str() + text.size()) return false;
    if (!std::isfinite(v)) return false;
    value = v;
    return true;
}

AcquisitionScheduler::AcquisitionScheduler(InstrumentRegistry& registry, EventBus& bus,
                                           double timeout_sec)
    : registry_(registry)
    , bus_(bus)
    , timeout_sec_(timeout_sec)
    , running_(false)
    , interval_ms_(DEFAULT_INTERVAL_MS)
    , stop_requested_(false)
    , reschedule_(false)
    , accepting_(false)
    , ticks_(0)
    , overruns_(0)
    , measurements_(0)
    , parse_errors_(0)
    , query_failures_(0)
    , discarded_(0)
    , dispatch_sum_ms_(0)
    , min_dispatch_ms_(1e9)
    , max_dispatch_ms_(0)
    , start_time_(0)
    , last_stats_time_(0)
{}

AcquisitionScheduler::~AcquisitionScheduler() {
    stop();
    std::lock_guard<std::mutex> control(control_mutex_);
    reap_retired(true);
}

Error AcquisitionScheduler::start(int interval_ms) {
    if (interval_ms <= 0) {
        std::fprintf(stderr, "  [SCHED] Invalid interval %d ms\n", interval_ms);
        return Error::ConfigError;
    }

    std::lock_guard<std::mutex> control(control_mutex_);

    if (running_.load(std::memory_order_acquire)) {
        {
            std::lock_guard<std::mutex> lock(tick_mutex_);
            interval_ms_.store(interval_ms, std::memory_order_release);
            reschedule_ = true;
        }
        tick_cv_.notify_all();
        std::printf("  [SCHED] Interval updated to %d ms\n", interval_ms);
        return Error::Ok;
    }

    if (registry_.active_devices().empty()) {
        std::fprintf(stderr, "  [SCHED] No enabled, connected devices -- not starting\n");
        return Error::NoDevicesConfigured;
    }

    reap_retired(false);

    interval_ms_.store(interval_ms, std::memory_order_release);
    {
        std::unique_lock<std::shared_mutex> lock(emit_mutex_);
        accepting_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        stop_requested_ = false;
        reschedule_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        start_time_ = clock_monotonic();
        last_stats_time_ = start_time_;
    }

    running_.store(true, std::memory_order_release);
    tick_thread_ = std::thread(&AcquisitionScheduler::tick_loop, this);

    std::printf("  [SCHED] Started: interval %d ms, timeout %.1f s\n",
                interval_ms, timeout_sec_);
    return Error::Ok;
}

void AcquisitionScheduler::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (!running_.load(std::memory_order_acquire)) return;

    // Waits for any publication in progress; later ones see accepting_ == false
    {
        std::unique_lock<std::shared_mutex> lock(emit_mutex_);
        accepting_ = false;
    }

    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        stop_requested_ = true;
    }
    tick_cv_.notify_all();
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }

    for (auto& kv : workers_) {
        kv.second->request_stop();
        retired_.push_back(std::move(kv.second));
    }
    workers_.clear();
    reap_retired(false);

    running_.store(false, std::memory_order_release);

    std::printf("  [SCHED] Stopped\n");
    print_stats();
}

void AcquisitionScheduler::tick_loop() {
    using clock = std::chrono::steady_clock;
    auto next = clock::now();
    auto last = next;

    std::unique_lock<std::mutex> lock(tick_mutex_);
    while (!stop_requested_) {
        if (tick_cv_.wait_until(lock, next, [this] { return stop_requested_ || reschedule_; })) {
            if (stop_requested_) break;

            // New interval: re-space from the last tick instead of the old deadline
            reschedule_ = false;
            next = last + std::chrono::milliseconds(interval_ms_.load(std::memory_order_acquire));
            auto now = clock::now();
            if (next < now) {
                next = now;
            }
            continue;
        }

        last = next;
        lock.unlock();
        run_tick();
        lock.lock();

        // Best-effort spacing: missed deadlines are skipped, not replayed
        next += std::chrono::milliseconds(interval_ms_.load(std::memory_order_acquire));
        auto now = clock::now();
        if (next < now) {
            next = now;
        }
    }
}

void AcquisitionScheduler::run_tick() {
    double tick_start = clock_monotonic();

    std::vector<DeviceConfig> active = registry_.active_devices();
    std::set<std::string> active_names;
    for (const auto& c : active) {
        active_names.insert(c.name);
    }

    // Retire workers of devices that were disabled, removed or disconnected
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (!active_names.count(it->first)) {
            it->second->request_stop();
            retired_.push_back(std::move(it->second));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    reap_retired(false);

    for (const auto& config : active) {
        auto it = workers_.find(config.name);
        if (it == workers_.end()) {
            it = workers_.emplace(config.name,
                                  std::make_unique<DeviceWorker>(*this, config.name)).first;
        }
        if (!it->second->trigger(config, timeout_sec_)) {
            overruns_.fetch_add(1, std::memory_order_relaxed);
            std::printf("  [SCHED] %s: previous query still outstanding, skipping tick\n",
                        config.name.c_str());
        }
    }

    ticks_.fetch_add(1, std::memory_order_relaxed);

    double tick_end = clock_monotonic();
    double dispatch_ms = (tick_end - tick_start) * 1000.0;
    bool print = false;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        dispatch_sum_ms_ += dispatch_ms;
        if (dispatch_ms < min_dispatch_ms_) min_dispatch_ms_ = dispatch_ms;
        if (dispatch_ms > max_dispatch_ms_) max_dispatch_ms_ = dispatch_ms;
        if (tick_end - last_stats_time_ >= STATS_INTERVAL_SEC) {
            last_stats_time_ = tick_end;
            print = true;
        }
    }
    if (print) {
        print_stats();
    }
}

void AcquisitionScheduler::reap_retired(bool wait) {
    for (auto it = retired_.begin(); it != retired_.end();) {
        if (wait || (*it)->finished()) {
            (*it)->stop();
            it = retired_.erase(it);
        } else {
            ++it;
        }
    }
}

void AcquisitionScheduler::poll_device(DeviceWorker& worker, const DeviceConfig& config,
                                       double timeout_sec) {
    const int samples = config.sample_count > 0 ? config.sample_count : 1;
    const double deadline = clock_monotonic() + timeout_sec;

    double mean = 0.0;      // Running mean: stays finite for finite readings
    std::string reply;
    bool parsed = true;

    for (int i = 0; i < samples; ++i) {
        double remaining = deadline - clock_monotonic();
        QueryStatus st = QueryStatus::Timeout;
        if (remaining > 0) {
            st = registry_.query(config.name, config.resolved_command, remaining, reply);
        }

        if (st != QueryStatus::Ok) {
            // No measurement; the device stays connected for the next tick
            query_failures_.fetch_add(1, std::memory_order_relaxed);
            char msg[256];
            std::snprintf(msg, sizeof(msg), "query '%s' failed: %s",
                          config.resolved_command.c_str(), query_status_name(st));
            deliver(worker, make_device_event(EventType::DeviceError, config.name, msg));
            return;
        }

        double v;
        if (!parse_reading(reply, v)) {
            parsed = false;
            break;
        }
        mean += v / (i + 1) - mean / (i + 1);
    }

    Measurement m;
    m.timestamp = now_timestamp();
    m.device_name = config.name;
    m.function = config.function;
    m.user_label = config.user_label;

    if (parsed) {
        m.value = mean;
        m.unit = unit_for(config.function);
        m.status = MeasurementStatus::Ok;
        deliver(worker, make_measurement_event(m));
    } else {
        parse_errors_.fetch_add(1, std::memory_order_relaxed);
        m.value = 0.0;
        m.status = MeasurementStatus::Error;
        deliver(worker, make_measurement_event(m));
        deliver(worker, make_device_event(EventType::DeviceError, config.name,
                                          "unparseable reply: '" + reply + "'"));
    }
}

void AcquisitionScheduler::deliver(const DeviceWorker& worker, const Event& e) {
    std::shared_lock<std::shared_mutex> lock(emit_mutex_);
    if (!accepting_ || worker.discarding()) {
        discarded_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    if (e.type == EventType::MeasurementRecorded) {
        measurements_.fetch_add(1, std::memory_order_relaxed);
    }
    bus_.publish(e);
}

AcquisitionScheduler::Stats AcquisitionScheduler::get_stats() const {
    Stats s{};
    s.ticks = ticks_.load(std::memory_order_relaxed);
    s.overruns = overruns_.load(std::memory_order_relaxed);
    s.measurements = measurements_.load(std::memory_order_relaxed);
    s.parse_errors = parse_errors_.load(std::memory_order_relaxed);
    s.query_failures = query_failures_.load(std::memory_order_relaxed);
    s.discarded = discarded_.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(stats_mutex_);
    s.min_dispatch_ms = s.ticks > 0 ? min_dispatch_ms_ : 0;
    s.max_dispatch_ms = max_dispatch_ms_;
    s.mean_dispatch_ms = s.ticks > 0 ? dispatch_sum_ms_ / s.ticks : 0;
    s.runtime_sec = start_time_ > 0 ? clock_monotonic() - start_time_ : 0;
    return s;
}

void AcquisitionScheduler::print_stats() const {
    Stats s = get_stats();
    std::printf("\n  [SCHED %6.0fs] ticks=%lu measurements=%lu parse_errors=%lu "
                "failures=%lu overruns=%lu discarded=%lu dispatch=%.2f/%.2f/%.2fms\n",
                s.runtime_sec,
                static_cast<unsigned long>(s.ticks),
                static_cast<unsigned long>(s.measurements),
                static_cast<unsigned long>(s.parse_errors),
                static_cast<unsigned long>(s.query_failures),
                static_cast<unsigned long>(s.overruns),
                static_cast<unsigned long>(s.discarded),
                s.min_dispatch_ms, s.mean_dispatch_ms, s.max_dispatch_ms);
}

} // namespace benchlog
