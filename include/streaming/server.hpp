#pragma once

#include "acquisition/events.hpp"
#include "streaming/protocol.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace benchlog {

// Live feed for a charting client.
//
// Subscribes to the event bus; on_event() only formats the event and pushes
// it onto a bounded queue, so a slow or absent client never blocks a device
// worker. One client at a time: a new connection replaces the old one.
// Per connection: one metadata JSON line, then LZ4 frames of NDJSON events
// flushed at BATCH_SIZE events or FLUSH_TIMEOUT_MS.
class FeedServer : public EventSink {
public:
    // Produces the metadata line for each new client
    using MetadataFn = std::function<std::string()>;

    explicit FeedServer(MetadataFn metadata);
    ~FeedServer() override;

    FeedServer(const FeedServer&) = delete;
    FeedServer& operator=(const FeedServer&) = delete;

    void on_event(const Event& e) override;

    // Port 0 picks an ephemeral port (see port()). Returns false if the
    // listening socket could not be set up.
    bool start(const std::string& host, int port);
    void stop();

    // Bound port after start()
    int port() const { return port_; }

    struct Stats {
        uint64_t events_sent;
        uint64_t batches_sent;
        uint64_t drops;
        uint64_t clients;
        size_t   queued;
        bool     connected;
    };
    Stats get_stats() const;

private:
    void accept_loop();
    void stream_loop();
    void drop_client(const char* reason);
    bool flush_batch();

    MetadataFn metadata_;

    // Threads
    std::thread accept_thread_;
    std::thread stream_thread_;
    std::atomic<bool> stop_flag_;

    // Accept -> stream handoff (fd or -1)
    std::atomic<int> pending_client_fd_;

    // Sockets (owned solely by their respective threads)
    int listen_fd_;
    int client_fd_;     // owned by stream_thread only

    // Event queue (bounded, oldest kept, newest dropped when full)
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;

    // Current batch, owned by stream_thread
    std::string batch_;
    uint32_t batch_count_;
    std::vector<uint8_t> frame_buf_;

    // LZ4 streaming context (allocated once)
    LZ4F_cctx* lz4_ctx_;

    // Stats (atomics for cross-thread reads)
    std::atomic<uint64_t> events_sent_;
    std::atomic<uint64_t> batches_sent_;
    std::atomic<uint64_t> drops_;
    std::atomic<uint64_t> clients_;
    std::atomic<bool>     connected_;

    int port_;
};

} // namespace benchlog
