#include "transport/socket_transport.hpp"
#include "transport/socket_io.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <utility>

#include <sys/socket.h>

namespace benchlog {

static std::vector<std::string> split_visa(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find("::", start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 2;
    }
}

static bool parse_port_number(const std::string& s, int& port) {
    if (s.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || v <= 0 || v > 65535) return false;
    port = static_cast<int>(v);
    return true;
}

bool parse_socket_address(const std::string& address, std::string& host, int& port) {
    if (address.compare(0, 5, "TCPIP") == 0) {
        // TCPIP[n]::host[::port]::SOCKET
        auto parts = split_visa(address);
        if (parts.size() < 3 || parts.back() != "SOCKET") return false;
        host = parts[1];
        port = SCPI_RAW_PORT;
        if (parts.size() == 4 && !parse_port_number(parts[2], port)) return false;
        if (parts.size() > 4) return false;
        return !host.empty();
    }

    size_t colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (address.find("::") != std::string::npos) return false;
    host = address.substr(0, colon);
    return parse_port_number(address.substr(colon + 1), port);
}

// --- SocketSession ---

SocketSession::SocketSession(int fd, const std::string& address)
    : fd_(fd)
    , address_(address)
    , aborted_(false)
{}

SocketSession::~SocketSession() {
    close();
}

QueryStatus SocketSession::query(const std::string& command, double timeout_sec,
                                 std::string& reply) {
    reply.clear();
    if (fd_ < 0 || aborted_.load(std::memory_order_acquire)) {
        return QueryStatus::Closed;
    }

    double deadline = clock_monotonic() + timeout_sec;

    // A reply that arrived after a previous timeout must not be taken as ours
    drain_input(fd_);

    std::string line = command;
    line.push_back('\n');
    if (!send_all(fd_, reinterpret_cast<const uint8_t*>(line.data()), line.size(),
                  timeout_sec)) {
        if (aborted_.load(std::memory_order_acquire)) return QueryStatus::Closed;
        return clock_monotonic() >= deadline ? QueryStatus::Timeout : QueryStatus::IOFailure;
    }

    switch (recv_line(fd_, reply, deadline)) {
        case RecvResult::Line:
            return QueryStatus::Ok;
        case RecvResult::Timeout:
            return QueryStatus::Timeout;
        case RecvResult::Closed:
            return aborted_.load(std::memory_order_acquire) ? QueryStatus::Closed
                                                            : QueryStatus::IOFailure;
        case RecvResult::Error:
            break;
    }
    return aborted_.load(std::memory_order_acquire) ? QueryStatus::Closed
                                                    : QueryStatus::IOFailure;
}

void SocketSession::abort() {
    aborted_.store(true, std::memory_order_release);
    // shutdown() wakes a poll() blocked in another thread; the fd stays valid
    // until close()
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void SocketSession::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// --- SocketTransport ---

SocketTransport::SocketTransport(std::vector<std::string> known_addresses,
                                 double connect_timeout_sec)
    : known_(std::move(known_addresses))
    , connect_timeout_(connect_timeout_sec)
{}

std::vector<std::string> SocketTransport::list_addresses() {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_;
}

void SocketTransport::add_address(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(known_.begin(), known_.end(), address) == known_.end()) {
        known_.push_back(address);
    }
}

Error SocketTransport::open(const std::string& address, std::unique_ptr<Session>& out,
                            std::string& detail) {
    std::string host;
    int port = 0;
    if (!parse_socket_address(address, host, port)) {
        detail = "not a socket address: " + address;
        return Error::ConfigError;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    char port_str[16];
    std::snprintf(port_str, sizeof(port_str), "%d", port);

    int gai = getaddrinfo(host.c_str(), port_str, &hints, &res);
    if (gai != 0) {
        detail = "cannot resolve " + host + ": " + gai_strerror(gai);
        return Error::ConnectionError;
    }

    int fd = -1;
    detail.clear();
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        set_nonblocking(fd);

        // Non-blocking connect bounded by connect_timeout_
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int ret = poll(&pfd, 1, static_cast<int>(connect_timeout_ * 1000));
            if (ret > 0) {
                int err = 0;
                socklen_t len = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
                rc = (err == 0) ? 0 : -1;
                if (err != 0) errno = err;
            } else {
                errno = ETIMEDOUT;
                rc = -1;
            }
        }

        if (rc == 0) break;

        detail = std::string("connect ") + host + ":" + port_str + " failed: " +
                 std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        if (detail.empty()) detail = "no usable address for " + host;
        return Error::ConnectionError;
    }

    tune_stream_socket(fd);

    out = std::make_unique<SocketSession>(fd, address);
    add_address(address);
    return Error::Ok;
}

} // namespace benchlog
