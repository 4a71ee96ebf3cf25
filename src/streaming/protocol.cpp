#include "streaming/protocol.hpp"
#include "export/encoder.hpp"
#include "instrument/command_table.hpp"

#include <nlohmann/json.hpp>
#include <lz4frame.h>

#include <cstdio>
#include <cstring>

namespace benchlog {

using json = nlohmann::json;

std::string event_to_json_line(const Event& e) {
    json j;
    j["type"] = event_type_name(e.type);
    j["timestamp"] = format_timestamp(e.timestamp, true);
    j["device"] = e.device_name;

    if (e.type == EventType::MeasurementRecorded) {
        const Measurement& m = e.measurement;
        j["function"] = m.function;
        j["value"] = m.value;
        j["unit"] = m.unit;
        j["status"] = status_name(m.status);
        j["user_label"] = m.user_label;
    } else {
        j["message"] = e.message;
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string build_metadata_json(const std::vector<DeviceConfig>& devices, int interval_ms) {
    json devs = json::array();
    for (const auto& d : devices) {
        devs.push_back({
            {"name",       d.name},
            {"function",   d.function},
            {"unit",       unit_for(d.function)},
            {"range",      d.range},
            {"samples",    d.sample_count},
            {"user_label", d.user_label},
            {"enabled",    d.enabled},
        });
    }

    json meta = {
        {"format",      "ndjson_lz4"},
        {"batch_size",  BATCH_SIZE},
        {"interval_ms", interval_ms},
        {"functions",   function_names()},
        {"devices",     devs},
    };
    return meta.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

bool encode_frame(LZ4F_cctx* ctx, const std::string& ndjson, uint32_t event_count,
                  std::vector<uint8_t>& frame) {
    frame.clear();
    if (!ctx) return false;

    size_t cap = LZ4F_compressBound(ndjson.size(), nullptr) + LZ4F_HEADER_SIZE_MAX + 8;
    frame.resize(FRAME_HEADER_SIZE + cap);
    uint8_t* out = frame.data() + FRAME_HEADER_SIZE;

    // compressBegin + compressUpdate + compressEnd, context reused per batch
    size_t hdr_sz = LZ4F_compressBegin(ctx, out, cap, nullptr);
    if (LZ4F_isError(hdr_sz)) {
        std::fprintf(stderr, "  [FEED] LZ4 compressBegin error: %s\n", LZ4F_getErrorName(hdr_sz));
        frame.clear();
        return false;
    }

    size_t body_sz = LZ4F_compressUpdate(ctx, out + hdr_sz, cap - hdr_sz,
                                         ndjson.data(), ndjson.size(), nullptr);
    if (LZ4F_isError(body_sz)) {
        std::fprintf(stderr, "  [FEED] LZ4 compressUpdate error: %s\n", LZ4F_getErrorName(body_sz));
        frame.clear();
        return false;
    }

    size_t ftr_sz = LZ4F_compressEnd(ctx, out + hdr_sz + body_sz, cap - hdr_sz - body_sz, nullptr);
    if (LZ4F_isError(ftr_sz)) {
        std::fprintf(stderr, "  [FEED] LZ4 compressEnd error: %s\n", LZ4F_getErrorName(ftr_sz));
        frame.clear();
        return false;
    }

    uint32_t cs = static_cast<uint32_t>(hdr_sz + body_sz + ftr_sz);
    std::memcpy(frame.data(), &cs, 4);
    std::memcpy(frame.data() + 4, &event_count, 4);
    frame.resize(FRAME_HEADER_SIZE + cs);
    return true;
}

bool decode_frame(const uint8_t* data, size_t len, std::string& ndjson, uint32_t& event_count) {
    if (len < FRAME_HEADER_SIZE) return false;

    uint32_t cs;
    std::memcpy(&cs, data, 4);
    std::memcpy(&event_count, data + 4, 4);
    if (FRAME_HEADER_SIZE + cs != len) return false;

    LZ4F_dctx* dctx = nullptr;
    if (LZ4F_isError(LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION))) return false;

    ndjson.clear();
    const uint8_t* src = data + FRAME_HEADER_SIZE;
    size_t remaining = cs;
    char chunk[16384];
    bool ok = true;

    for (;;) {
        size_t dst_sz = sizeof(chunk);
        size_t src_sz = remaining;
        size_t hint = LZ4F_decompress(dctx, chunk, &dst_sz, src, &src_sz, nullptr);
        if (LZ4F_isError(hint)) {
            ok = false;
            break;
        }
        ndjson.append(chunk, dst_sz);
        src += src_sz;
        remaining -= src_sz;
        if (hint == 0) break;               // Frame complete
        if (src_sz == 0 && dst_sz == 0) {   // Truncated frame
            ok = false;
            break;
        }
    }

    LZ4F_freeDecompressionContext(dctx);
    return ok && remaining == 0;
}

} // namespace benchlog
