#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace benchlog {

// CLOCK_MONOTONIC in seconds
double clock_monotonic();

// Non-blocking send loop with timeout using poll(POLLOUT).
// Returns true if all data was sent, false on timeout or error.
// Always uses MSG_NOSIGNAL.
bool send_all(int fd, const uint8_t* data, size_t len, double timeout_sec);

enum class RecvResult {
    Line,       // A full line is in `line` (terminator stripped)
    Timeout,
    Closed,     // Peer sent FIN or the socket was shut down locally
    Error,
};

// Read until '\n' or deadline (CLOCK_MONOTONIC seconds). A trailing '\r' is
// stripped. Bytes after the terminator are discarded.
RecvResult recv_line(int fd, std::string& line, double deadline);

// Discard anything already queued on the socket (stale replies)
void drain_input(int fd);

// Set O_NONBLOCK
bool set_nonblocking(int fd);

// TCP_NODELAY plus keepalive probing (idle 10 s, every 5 s, 3 probes), so a
// powered-off peer is noticed within ~25 s
void tune_stream_socket(int fd);

} // namespace benchlog
