#pragma once

#include "transport/transport.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace benchlog {

constexpr int    SCPI_RAW_PORT           = 5025;
constexpr double DEFAULT_CONNECT_TIMEOUT = 5.0;

// Split a socket address into host + port. Accepted forms:
//   TCPIP0::192.168.1.20::5025::SOCKET   (VISA raw socket resource string)
//   TCPIP::bench-dmm::SOCKET             (port defaults to 5025)
//   192.168.1.20:5025
// Returns false if the address is not a socket address.
bool parse_socket_address(const std::string& address, std::string& host, int& port);

// SCPI over a raw TCP socket. Commands are '\n'-terminated; each query reads
// one '\n'-terminated reply line.
class SocketSession : public Session {
public:
    SocketSession(int fd, const std::string& address);
    ~SocketSession() override;

    SocketSession(const SocketSession&) = delete;
    SocketSession& operator=(const SocketSession&) = delete;

    QueryStatus query(const std::string& command, double timeout_sec,
                      std::string& reply) override;
    void abort() override;
    void close() override;
    const std::string& address() const override { return address_; }

private:
    int fd_;
    std::string address_;
    std::atomic<bool> aborted_;
};

// Raw sockets cannot be enumerated: list_addresses() returns the addresses
// the transport was configured with.
class SocketTransport : public Transport {
public:
    explicit SocketTransport(std::vector<std::string> known_addresses = {},
                             double connect_timeout_sec = DEFAULT_CONNECT_TIMEOUT);

    std::vector<std::string> list_addresses() override;
    Error open(const std::string& address, std::unique_ptr<Session>& out,
               std::string& detail) override;

    void add_address(const std::string& address);

private:
    std::mutex mutex_;
    std::vector<std::string> known_;
    double connect_timeout_;
};

} // namespace benchlog
