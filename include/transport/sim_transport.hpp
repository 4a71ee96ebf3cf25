#pragma once

#include "transport/transport.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace benchlog {

// Built-in simulated multimeter bank, addresses SIM::1 .. SIM::<count>.
// Lets the whole pipeline run without instruments attached.
class SimSession : public Session {
public:
    SimSession(const std::string& address, uint32_t seed, int latency_ms);

    QueryStatus query(const std::string& command, double timeout_sec,
                      std::string& reply) override;
    void abort() override;
    void close() override;
    const std::string& address() const override { return address_; }

private:
    // Nominal reading for the function addressed by a MEAS/CONF command
    bool nominal_for(const std::string& command, double& nominal) const;

    std::string address_;
    int latency_ms_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool aborted_;
    bool closed_;
    std::mt19937 rng_;
};

class SimTransport : public Transport {
public:
    explicit SimTransport(int count = 4, int latency_ms = 20);

    std::vector<std::string> list_addresses() override;
    Error open(const std::string& address, std::unique_ptr<Session>& out,
               std::string& detail) override;

private:
    int count_;
    int latency_ms_;
};

} // namespace benchlog
