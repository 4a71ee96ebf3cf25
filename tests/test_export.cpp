#include "export/encoder.hpp"
#include "export/file_writer.hpp"
#include "storage/measurement_store.hpp"

#include <gtest/gtest.h>
#include <lz4frame.h>

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <tuple>
#include <unistd.h>

using namespace benchlog;

namespace {

Measurement make(const std::string& device, double value, MeasurementStatus status,
                 const std::string& label, int64_t us) {
    Measurement m;
    m.timestamp = Timestamp(std::chrono::microseconds(us));
    m.device_name = device;
    m.function = status == MeasurementStatus::Ok ? "DC Voltage" : "Resistance (2-wire)";
    m.value = value;
    m.unit = status == MeasurementStatus::Ok ? "V" : "";
    m.status = status;
    m.user_label = label;
    return m;
}

void fill(MeasurementStore& store) {
    // 2024-03-01 around noon UTC, odd microsecond counts
    const int64_t base = 1709294400LL * 1000000;
    store.record(make("DMM1", 5.123456789, MeasurementStatus::Ok, "supply rail", base + 1));
    store.record(make("DMM2", 0.0, MeasurementStatus::Error, "load, hot", base + 250001));
    store.record(make("DMM1", -1.5e-7, MeasurementStatus::Ok, "say \"hi\"", base + 999999));
}

std::string temp_path(const char* suffix) {
    char buf[] = "/tmp/benchlog_export_XXXXXX";
    int fd = mkstemp(buf);
    if (fd >= 0) {
        ::close(fd);
        ::unlink(buf);
    }
    return std::string(buf) + suffix;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(Export, ParseFormatIsCaseInsensitive) {
    ExportFormat f;
    EXPECT_EQ(parse_format("csv", f), Error::Ok);
    EXPECT_EQ(f, ExportFormat::CSV);
    EXPECT_EQ(parse_format("Json", f), Error::Ok);
    EXPECT_EQ(f, ExportFormat::JSON);
    EXPECT_EQ(parse_format("TXT", f), Error::Ok);
    EXPECT_EQ(f, ExportFormat::TXT);
    EXPECT_EQ(parse_format("xlsx", f), Error::UnsupportedFormat);
}

TEST(Export, EmptyLogIsNoData) {
    MeasurementStore store;
    std::string out = "untouched";
    for (ExportFormat f : {ExportFormat::CSV, ExportFormat::JSON, ExportFormat::TXT}) {
        EXPECT_EQ(export_measurements(store, f, std::nullopt, out), Error::NoData);
    }
    EXPECT_EQ(out, "untouched");

    fill(store);
    EXPECT_EQ(export_measurements(store, ExportFormat::CSV, std::string("DMM9"), out),
              Error::NoData);
}

TEST(Export, UnsupportedFormatName) {
    MeasurementStore store;
    fill(store);
    std::string out;
    EXPECT_EQ(export_measurements(store, "xml", std::nullopt, out), Error::UnsupportedFormat);
}

TEST(Export, CsvHeaderAndQuoting) {
    MeasurementStore store;
    fill(store);
    std::string csv;
    ASSERT_EQ(export_measurements(store, "csv", std::nullopt, csv), Error::Ok);

    std::istringstream in(csv);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "Timestamp,Device,Function,Value,Unit,Status,User Label");

    std::getline(in, line);
    EXPECT_NE(line.find(",DMM1,DC Voltage,5.123456789,V,OK,supply rail"), std::string::npos);
    // "YYYY-MM-DD HH:MM:SS.ffffff"
    ASSERT_GE(line.size(), 26u);
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[19], '.');
    EXPECT_EQ(line.substr(20, 6), "000001");

    std::getline(in, line);
    EXPECT_NE(line.find(",ERROR,\"load, hot\""), std::string::npos);

    std::getline(in, line);
    EXPECT_NE(line.find("\"say \"\"hi\"\"\""), std::string::npos);
}

TEST(Export, DeviceFilter) {
    MeasurementStore store;
    fill(store);
    std::string csv;
    ASSERT_EQ(export_measurements(store, ExportFormat::CSV, std::string("DMM1"), csv), Error::Ok);
    EXPECT_EQ(csv.find("DMM2"), std::string::npos);
    EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), 3);
}

TEST(Export, JsonRoundTrip) {
    MeasurementStore store;
    fill(store);
    std::string payload;
    ASSERT_EQ(export_measurements(store, ExportFormat::JSON, std::nullopt, payload), Error::Ok);

    std::vector<Measurement> decoded;
    ASSERT_EQ(decode_json(payload, decoded), Error::Ok);

    auto original = store.query();
    ASSERT_EQ(decoded.size(), original.size());
    for (size_t i = 0; i < original.size(); ++i) {
        const Measurement& a = original[i];
        const Measurement& b = decoded[i];
        EXPECT_EQ(std::tie(a.device_name, a.function, a.unit, a.user_label),
                  std::tie(b.device_name, b.function, b.unit, b.user_label));
        EXPECT_EQ(a.value, b.value);
        EXPECT_EQ(a.status, b.status);
        EXPECT_EQ(a.timestamp, b.timestamp);
    }
}

TEST(Export, JsonKeys) {
    MeasurementStore store;
    fill(store);
    std::string payload;
    ASSERT_EQ(export_measurements(store, ExportFormat::JSON, std::nullopt, payload), Error::Ok);
    for (const char* key : {"\"timestamp\"", "\"device_name\"", "\"function\"", "\"value\"",
                            "\"unit\"", "\"status\"", "\"user_label\""}) {
        EXPECT_NE(payload.find(key), std::string::npos) << key;
    }
}

TEST(Export, DecodeRejectsGarbage) {
    std::vector<Measurement> out;
    EXPECT_EQ(decode_json("not json", out), Error::UnsupportedFormat);
    EXPECT_EQ(decode_json("{\"a\":1}", out), Error::UnsupportedFormat);
    EXPECT_EQ(decode_json("[{\"device_name\":\"x\"}]", out), Error::UnsupportedFormat);
    EXPECT_TRUE(out.empty());
}

TEST(Export, TxtBannerAndTable) {
    MeasurementStore store;
    fill(store);
    std::string txt;
    ASSERT_EQ(export_measurements(store, ExportFormat::TXT, std::nullopt, txt), Error::Ok);

    EXPECT_EQ(txt.rfind("benchlog - Measurement Data Export\n", 0), 0u);
    EXPECT_NE(txt.find("Export Date: "), std::string::npos);
    EXPECT_NE(txt.find("Total Records: 3\n"), std::string::npos);
    EXPECT_NE(txt.find("5.123457"), std::string::npos);
    EXPECT_NE(txt.find("-0.000000"), std::string::npos);
    EXPECT_NE(txt.find(" | "), std::string::npos);
}

TEST(Export, TxtKeepsLongFieldsWhole) {
    MeasurementStore store;
    const std::string device(40, 'D');
    const std::string label(700, 'L');
    store.record(make(device, 1.7e308, MeasurementStatus::Ok, label, 1709294400LL * 1000000));
    store.record(make("DMM2", 2.0, MeasurementStatus::Ok, "short", 1709294401LL * 1000000));

    std::string txt;
    ASSERT_EQ(export_measurements(store, ExportFormat::TXT, std::nullopt, txt), Error::Ok);

    size_t row = txt.find(device + " | ");
    ASSERT_NE(row, std::string::npos);
    size_t end = txt.find('\n', row);
    ASSERT_NE(end, std::string::npos);
    std::string line = txt.substr(row, end - row);
    EXPECT_EQ(line.size() - line.rfind(label), label.size());
    EXPECT_NE(line.find(" | OK     | "), std::string::npos);

    // The following row still starts on its own line
    EXPECT_NE(txt.find("\n" + format_timestamp(Timestamp(std::chrono::microseconds(
                           1709294401LL * 1000000)))), std::string::npos);
}

TEST(Export, TimestampTextRoundTrip) {
    Timestamp ts(std::chrono::microseconds(1709294400LL * 1000000 + 123456));
    Timestamp back;
    ASSERT_TRUE(parse_timestamp(format_timestamp(ts), back));
    EXPECT_EQ(back, ts);
    ASSERT_TRUE(parse_timestamp(format_timestamp(ts, true), back));
    EXPECT_EQ(back, ts);
    EXPECT_FALSE(parse_timestamp("yesterday", back));
}

namespace {

// Pins TZ for one test and restores the previous value
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const char* tz) {
        const char* prev = std::getenv("TZ");
        had_prev_ = prev != nullptr;
        if (had_prev_) prev_ = prev;
        ::setenv("TZ", tz, 1);
        ::tzset();
    }
    ~ScopedTimeZone() {
        if (had_prev_) {
            ::setenv("TZ", prev_.c_str(), 1);
        } else {
            ::unsetenv("TZ");
        }
        ::tzset();
    }

private:
    bool had_prev_ = false;
    std::string prev_;
};

} // namespace

TEST(Export, IsoTimestampCarriesOffset) {
    ScopedTimeZone tz("UTC");
    Timestamp ts(std::chrono::microseconds(1709294400LL * 1000000 + 5));
    EXPECT_EQ(format_timestamp(ts, true), "2024-03-01T12:00:00.000005+00:00");

    Timestamp back;
    ASSERT_TRUE(parse_timestamp("2024-03-01T07:00:00.000005-05:00", back));
    EXPECT_EQ(back, ts);
    ASSERT_TRUE(parse_timestamp("2024-03-01T12:00:00.000005Z", back));
    EXPECT_EQ(back, ts);
    EXPECT_FALSE(parse_timestamp("2024-03-01T12:00:00.000005+5", back));
}

TEST(Export, JsonTimestampsSurviveDstFallBack) {
    ScopedTimeZone tz("America/New_York");

    // 01:30 EDT and 01:30 EST on 2024-11-03: same wall clock, one hour apart
    const int64_t first = 1730611800LL * 1000000 + 123456;
    const int64_t second = 1730615400LL * 1000000 + 123456;

    std::string a = format_timestamp(Timestamp(std::chrono::microseconds(first)), true);
    std::string b = format_timestamp(Timestamp(std::chrono::microseconds(second)), true);
    EXPECT_EQ(a, "2024-11-03T01:30:00.123456-04:00");
    EXPECT_EQ(b, "2024-11-03T01:30:00.123456-05:00");

    MeasurementStore store;
    store.record(make("DMM1", 1.0, MeasurementStatus::Ok, "", first));
    store.record(make("DMM1", 2.0, MeasurementStatus::Ok, "", second));

    std::string payload;
    ASSERT_EQ(export_measurements(store, ExportFormat::JSON, std::nullopt, payload), Error::Ok);
    std::vector<Measurement> decoded;
    ASSERT_EQ(decode_json(payload, decoded), Error::Ok);
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded[0].timestamp.time_since_epoch().count(), first);
    EXPECT_EQ(decoded[1].timestamp.time_since_epoch().count(), second);
}

TEST(Export, WriteFileAtomically) {
    MeasurementStore store;
    fill(store);
    std::string path = temp_path(".csv");

    ASSERT_EQ(export_to_file(store, ExportFormat::CSV, std::nullopt, path), Error::Ok);
    std::string expected;
    ASSERT_EQ(export_measurements(store, ExportFormat::CSV, std::nullopt, expected), Error::Ok);
    EXPECT_EQ(read_file(path), expected);
    ::unlink(path.c_str());
}

TEST(Export, NoDataWritesNothing) {
    MeasurementStore store;
    std::string path = temp_path(".csv");
    EXPECT_EQ(export_to_file(store, ExportFormat::CSV, std::nullopt, path), Error::NoData);
    EXPECT_NE(::access(path.c_str(), F_OK), 0);
}

TEST(Export, UnwritableDirectoryIsIOFailure) {
    EXPECT_EQ(write_export_file("/nonexistent-benchlog-dir/out.csv", "x"), Error::IOFailure);
    EXPECT_EQ(write_export_file("", "x"), Error::IOFailure);
}

TEST(Export, Lz4FileDecompressesToPayload) {
    std::string path = temp_path(".json.lz4");
    std::string payload(5000, 'a');
    payload += "tail";
    ASSERT_EQ(write_export_file(path, payload), Error::Ok);

    std::string compressed = read_file(path);
    ASSERT_FALSE(compressed.empty());
    EXPECT_LT(compressed.size(), payload.size());

    LZ4F_dctx* dctx = nullptr;
    ASSERT_FALSE(LZ4F_isError(LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION)));
    std::string out(payload.size() + 64, '\0');
    size_t dst = out.size();
    size_t src = compressed.size();
    size_t rc = LZ4F_decompress(dctx, &out[0], &dst, compressed.data(), &src, nullptr);
    LZ4F_freeDecompressionContext(dctx);
    ASSERT_FALSE(LZ4F_isError(rc));
    out.resize(dst);
    EXPECT_EQ(out, payload);
    ::unlink(path.c_str());
}
