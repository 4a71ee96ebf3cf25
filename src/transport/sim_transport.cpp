#include "transport/sim_transport.hpp"
#include "instrument/command_table.hpp"

#include <chrono>
#include <cstdio>
#include <functional>

namespace benchlog {

// Nominal reading per function, indexed by Function
static const double NOMINAL[NUM_FUNCTIONS] = {
    5.0,      // DC Voltage
    1.2,      // AC Voltage
    0.010,    // DC Current
    0.005,    // AC Current
    1000.0,   // Resistance (2-wire)
    1000.0,   // Resistance (4-wire)
    1000.0,   // Frequency
    23.5,     // Temperature
};

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

SimSession::SimSession(const std::string& address, uint32_t seed, int latency_ms)
    : address_(address)
    , latency_ms_(latency_ms)
    , aborted_(false)
    , closed_(false)
    , rng_(seed)
{}

bool SimSession::nominal_for(const std::string& command, double& nominal) const {
    for (int i = 0; i < NUM_FUNCTIONS; ++i) {
        const FunctionInfo& f = function_info(static_cast<Function>(i));
        if (command == f.query ||
            (starts_with(command, f.configure) &&
             command.size() > std::char_traits<char>::length(f.configure) &&
             command[std::char_traits<char>::length(f.configure)] == ' ')) {
            nominal = NOMINAL[i];
            return true;
        }
    }
    return false;
}

QueryStatus SimSession::query(const std::string& command, double timeout_sec,
                              std::string& reply) {
    reply.clear();
    std::unique_lock<std::mutex> lock(mutex_);
    if (aborted_ || closed_) return QueryStatus::Closed;

    // Simulated bus + conversion time; abort() cuts it short
    auto wait = std::chrono::milliseconds(latency_ms_);
    auto limit = std::chrono::duration<double>(timeout_sec);
    if (wait > limit) {
        cv_.wait_for(lock, limit, [this] { return aborted_; });
        return aborted_ ? QueryStatus::Closed : QueryStatus::Timeout;
    }
    if (cv_.wait_for(lock, wait, [this] { return aborted_; })) {
        return QueryStatus::Closed;
    }

    char buf[64];
    if (command == CMD_IDENTIFY) {
        std::snprintf(buf, sizeof(buf), "BENCHLOG,SIM-DMM,%s,1.0", address_.c_str());
        reply = buf;
        return QueryStatus::Ok;
    }

    double nominal = 0.0;
    if (!nominal_for(command, nominal)) {
        // Real instruments stay silent on an unknown query
        return QueryStatus::Timeout;
    }

    std::normal_distribution<double> noise(0.0, nominal * 0.002);
    std::snprintf(buf, sizeof(buf), "%+.9E", nominal + noise(rng_));
    reply = buf;
    return QueryStatus::Ok;
}

void SimSession::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
    }
    cv_.notify_all();
}

void SimSession::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

SimTransport::SimTransport(int count, int latency_ms)
    : count_(count)
    , latency_ms_(latency_ms)
{}

std::vector<std::string> SimTransport::list_addresses() {
    std::vector<std::string> out;
    for (int i = 1; i <= count_; ++i) {
        out.push_back("SIM::" + std::to_string(i));
    }
    return out;
}

Error SimTransport::open(const std::string& address, std::unique_ptr<Session>& out,
                         std::string& detail) {
    for (const auto& a : list_addresses()) {
        if (a == address) {
            uint32_t seed = static_cast<uint32_t>(std::hash<std::string>{}(address));
            out = std::make_unique<SimSession>(address, seed, latency_ms_);
            return Error::Ok;
        }
    }
    detail = "no simulated instrument at " + address;
    return Error::ConnectionError;
}

} // namespace benchlog
