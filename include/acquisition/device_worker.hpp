#pragma once

#include "instrument/types.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace benchlog {

class AcquisitionScheduler;

// Block until the eventfd is signaled. Retries on EINTR; returns false on
// any other read error.
bool wait_wakeup(int event_fd);

// Persistent thread that polls a single instrument.
// One DeviceWorker per enabled device, so a slow or timed-out device never
// delays another device's query in the same tick.
//
// Signaling: eventfd for wake, atomic busy_ flag for completion. The tick
// thread never waits on a worker; a trigger that finds the worker still busy
// is refused and counted as an overrun.
class DeviceWorker {
public:
    DeviceWorker(AcquisitionScheduler& owner, const std::string& name);
    ~DeviceWorker();

    DeviceWorker(const DeviceWorker&) = delete;
    DeviceWorker& operator=(const DeviceWorker&) = delete;

    // Hand one poll to the worker (non-blocking).
    // Returns false if the previous poll is still outstanding.
    bool trigger(const DeviceConfig& config, double timeout_sec);

    // Ask the thread to exit after its current poll; results of that poll
    // are discarded. Does not block.
    void request_stop();

    // request_stop() + join
    void stop();

    bool busy() const { return busy_.load(std::memory_order_acquire); }
    bool finished() const { return finished_.load(std::memory_order_acquire); }
    bool discarding() const { return discard_.load(std::memory_order_acquire); }

    const std::string& name() const { return name_; }

private:
    void run();
    void wake();

    AcquisitionScheduler& owner_;
    std::string name_;
    int event_fd_;

    std::mutex pending_mutex_;
    DeviceConfig pending_config_;
    double pending_timeout_;

    std::atomic<bool> busy_;
    std::atomic<bool> running_;
    std::atomic<bool> finished_;
    std::atomic<bool> discard_;
    std::thread thread_;
};

} // namespace benchlog
