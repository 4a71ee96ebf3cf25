#pragma once

#include "acquisition/events.hpp"
#include "instrument/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declare LZ4F types to avoid including lz4frame.h in header
typedef struct LZ4F_cctx_s LZ4F_cctx;

namespace benchlog {

// Live feed protocol constants
constexpr int    BATCH_SIZE        = 32;
constexpr int    FLUSH_TIMEOUT_MS  = 100;
constexpr double SEND_TIMEOUT_SEC  = 2.0;
constexpr int    LISTEN_BACKLOG    = 1;
constexpr size_t QUEUE_CAPACITY    = 4096;
constexpr int    DEFAULT_FEED_PORT = 8888;

// Wire frame header: [uint32 LE compressed_size][uint32 LE event_count]
constexpr size_t FRAME_HEADER_SIZE = 8;

// One event as a single-line JSON object (no trailing newline).
//   measurement: {"type","timestamp","device","function","value","unit","status","user_label"}
//   others:      {"type","timestamp","device","message"}
std::string event_to_json_line(const Event& e);

// Metadata JSON sent once per connection, terminated by '\n'.
std::string build_metadata_json(const std::vector<DeviceConfig>& devices, int interval_ms);

// Compress an NDJSON batch into one wire frame (header + LZ4 frame).
// Returns false on an LZ4 error; frame is left empty then.
bool encode_frame(LZ4F_cctx* ctx, const std::string& ndjson, uint32_t event_count,
                  std::vector<uint8_t>& frame);

// Client side: decode one complete frame. Returns false if the header is
// inconsistent or the LZ4 payload is corrupt.
bool decode_frame(const uint8_t* data, size_t len, std::string& ndjson, uint32_t& event_count);

} // namespace benchlog
