#include "acquisition/device_worker.hpp"
#include "acquisition/scheduler.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/eventfd.h>
#include <unistd.h>

namespace benchlog {

DeviceWorker::DeviceWorker(AcquisitionScheduler& owner, const std::string& name)
    : owner_(owner)
    , name_(name)
    , event_fd_(-1)
    , pending_timeout_(0)
    , busy_(false)
    , running_(true)
    , finished_(false)
    , discard_(false)
{
    // Blocking eventfd: idle workers sleep in read()
    event_fd_ = eventfd(0, 0);
    if (event_fd_ < 0) {
        std::perror("eventfd");
        running_.store(false);
        finished_.store(true);
        return;
    }

    thread_ = std::thread(&DeviceWorker::run, this);
}

DeviceWorker::~DeviceWorker() {
    stop();
    if (event_fd_ >= 0) {
        ::close(event_fd_);
    }
}

void DeviceWorker::wake() {
    uint64_t val = 1;
    if (event_fd_ >= 0 && ::write(event_fd_, &val, sizeof(val)) != sizeof(val)) {
        std::perror("eventfd write");
    }
}

bool wait_wakeup(int event_fd) {
    uint64_t val;
    for (;;) {
        ssize_t ret = ::read(event_fd, &val, sizeof(val));
        if (ret == static_cast<ssize_t>(sizeof(val))) return true;
        if (ret < 0 && errno == EINTR) continue;
        return false;
    }
}

void DeviceWorker::run() {
    while (running_.load(std::memory_order_acquire)) {
        if (!wait_wakeup(event_fd_)) {
            std::fprintf(stderr, "  [SCHED] %s: eventfd read failed: %s -- worker exiting\n",
                         name_.c_str(), std::strerror(errno));
            // Later triggers are refused and counted as overruns
            running_.store(false, std::memory_order_release);
            break;
        }

        if (!running_.load(std::memory_order_acquire)) break;
        if (!busy_.load(std::memory_order_acquire)) continue;

        DeviceConfig config;
        double timeout_sec;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            config = pending_config_;
            timeout_sec = pending_timeout_;
        }

        owner_.poll_device(*this, config, timeout_sec);

        busy_.store(false, std::memory_order_release);
    }
    finished_.store(true, std::memory_order_release);
}

bool DeviceWorker::trigger(const DeviceConfig& config, double timeout_sec) {
    if (!running_.load(std::memory_order_acquire)) return false;
    if (busy_.exchange(true, std::memory_order_acq_rel)) return false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_config_ = config;
        pending_timeout_ = timeout_sec;
    }
    wake();
    return true;
}

void DeviceWorker::request_stop() {
    discard_.store(true, std::memory_order_release);
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    wake();
}

void DeviceWorker::stop() {
    request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace benchlog
