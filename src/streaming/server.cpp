#include "streaming/server.hpp"
#include "streaming/protocol.hpp"
#include "transport/socket_io.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <utility>
#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <lz4frame.h>

namespace benchlog {

FeedServer::FeedServer(MetadataFn metadata)
    : metadata_(std::move(metadata))
    , stop_flag_(false)
    , pending_client_fd_(-1)
    , listen_fd_(-1)
    , client_fd_(-1)
    , batch_count_(0)
    , lz4_ctx_(nullptr)
    , events_sent_(0)
    , batches_sent_(0)
    , drops_(0)
    , clients_(0)
    , connected_(false)
    , port_(0)
{
    // LZ4 context allocated once, reused per batch
    LZ4F_errorCode_t err = LZ4F_createCompressionContext(&lz4_ctx_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        std::fprintf(stderr, "  [FEED] LZ4 context creation failed: %s\n",
                     LZ4F_getErrorName(err));
        lz4_ctx_ = nullptr;
    }
}

FeedServer::~FeedServer() {
    stop();
    if (lz4_ctx_) {
        LZ4F_freeCompressionContext(lz4_ctx_);
    }
}

void FeedServer::on_event(const Event& e) {
    if (!connected_.load(std::memory_order_relaxed)) return;

    std::string line = event_to_json_line(e);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= QUEUE_CAPACITY) {
            drops_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        queue_.push_back(std::move(line));
    }
    queue_cv_.notify_one();
}

bool FeedServer::start(const std::string& host, int port) {
    if (!lz4_ctx_) return false;

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        std::fprintf(stderr, "  [FEED] socket() failed: %s\n", strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        std::fprintf(stderr, "  [FEED] Invalid listen address: %s\n", host.c_str());
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::fprintf(stderr, "  [FEED] bind(%s:%d) failed: %s\n", host.c_str(), port, strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (::listen(listen_fd_, LISTEN_BACKLOG) < 0) {
        std::fprintf(stderr, "  [FEED] listen() failed: %s\n", strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    } else {
        port_ = port;
    }

    std::printf("  [FEED] Listening on %s:%d\n", host.c_str(), port_);

    stop_flag_.store(false, std::memory_order_relaxed);
    accept_thread_ = std::thread(&FeedServer::accept_loop, this);
    stream_thread_ = std::thread(&FeedServer::stream_loop, this);
    return true;
}

void FeedServer::stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    queue_cv_.notify_all();

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (stream_thread_.joinable()) {
        stream_thread_.join();
    }

    // Closed after the join so the accept thread never polls a stale fd
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    int fd = pending_client_fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

FeedServer::Stats FeedServer::get_stats() const {
    Stats s{};
    s.events_sent = events_sent_.load(std::memory_order_relaxed);
    s.batches_sent = batches_sent_.load(std::memory_order_relaxed);
    s.drops = drops_.load(std::memory_order_relaxed);
    s.clients = clients_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        s.queued = queue_.size();
    }
    s.connected = connected_.load(std::memory_order_relaxed);
    return s;
}

void FeedServer::accept_loop() {
    while (!stop_flag_.load(std::memory_order_relaxed)) {
        // Short poll so stop() is noticed promptly
        struct pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 200);
        if (ret <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;

        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int fd = ::accept(listen_fd_,
                          reinterpret_cast<struct sockaddr*>(&client_addr),
                          &addr_len);
        if (fd < 0) continue;

        set_nonblocking(fd);
        tune_stream_socket(fd);

        char addr_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, sizeof(addr_str));
        std::printf("  [FEED] Client connected: %s:%d\n",
                    addr_str, ntohs(client_addr.sin_port));

        // Hand off to the stream thread
        int old_fd = pending_client_fd_.exchange(fd, std::memory_order_release);
        if (old_fd >= 0) {
            ::close(old_fd);
        }
        queue_cv_.notify_one();
    }
}

void FeedServer::drop_client(const char* reason) {
    std::printf("  [FEED] Client disconnected (%s)\n", reason);
    ::close(client_fd_);
    client_fd_ = -1;
    batch_.clear();
    batch_count_ = 0;
    connected_.store(false, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

bool FeedServer::flush_batch() {
    if (batch_count_ == 0) return true;

    bool ok = encode_frame(lz4_ctx_, batch_, batch_count_, frame_buf_);
    if (ok) {
        if (send_all(client_fd_, frame_buf_.data(), frame_buf_.size(), SEND_TIMEOUT_SEC)) {
            events_sent_.fetch_add(batch_count_, std::memory_order_relaxed);
            batches_sent_.fetch_add(1, std::memory_order_relaxed);
        } else {
            batch_.clear();
            batch_count_ = 0;
            return false;
        }
    }
    batch_.clear();
    batch_count_ = 0;
    return true;
}

void FeedServer::stream_loop() {
    double last_flush_time = clock_monotonic();
    double last_recv_check = last_flush_time;

    while (!stop_flag_.load(std::memory_order_relaxed)) {
        int new_fd = pending_client_fd_.exchange(-1, std::memory_order_acquire);
        if (new_fd >= 0) {
            if (client_fd_ >= 0) {
                drop_client("replaced");
            }
            client_fd_ = new_fd;

            std::string meta = metadata_ ? metadata_() : std::string("{}\n");
            bool ok = send_all(client_fd_, reinterpret_cast<const uint8_t*>(meta.data()),
                               meta.size(), SEND_TIMEOUT_SEC);
            if (!ok) {
                drop_client("metadata send failed");
                continue;
            }

            batch_.clear();
            batch_count_ = 0;
            last_flush_time = clock_monotonic();
            last_recv_check = last_flush_time;
            clients_.fetch_add(1, std::memory_order_relaxed);
            connected_.store(true, std::memory_order_relaxed);
            std::printf("  [FEED] Metadata sent, streaming...\n");
        }

        // Wait for events, a new client, stop, or the flush deadline
        std::deque<std::string> pending;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::milliseconds(client_fd_ >= 0 ? 10 : 100),
                               [this] {
                                   return !queue_.empty() ||
                                          stop_flag_.load(std::memory_order_relaxed) ||
                                          pending_client_fd_.load(std::memory_order_relaxed) >= 0;
                               });
            pending.swap(queue_);
        }

        if (client_fd_ < 0) continue;

        // Periodic recv() to detect client disconnect
        double now = clock_monotonic();
        if (now - last_recv_check >= 1.0) {
            char dummy;
            ssize_t r = ::recv(client_fd_, &dummy, 1, MSG_DONTWAIT);
            if (r == 0) {
                drop_client("FIN");
                continue;
            } else if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                drop_client(strerror(errno));
                continue;
            }
            last_recv_check = now;
        }

        bool alive = true;
        for (auto& line : pending) {
            batch_ += line;
            batch_ += '\n';
            batch_count_++;
            if (batch_count_ >= static_cast<uint32_t>(BATCH_SIZE)) {
                if (!flush_batch()) {
                    alive = false;
                    break;
                }
                last_flush_time = clock_monotonic();
            }
        }
        if (!alive) {
            drop_client("send failed");
            continue;
        }

        now = clock_monotonic();
        if (batch_count_ > 0 && (now - last_flush_time) * 1000.0 >= FLUSH_TIMEOUT_MS) {
            if (!flush_batch()) {
                drop_client("send failed");
                continue;
            }
            last_flush_time = now;
        } else if (batch_count_ == 0) {
            last_flush_time = now;
        }
    }

    if (client_fd_ >= 0) {
        ::close(client_fd_);
        client_fd_ = -1;
    }
    connected_.store(false, std::memory_order_relaxed);
}

} // namespace benchlog
