#include "export/encoder.hpp"
#include "storage/measurement_store.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>

namespace benchlog {

using json = nlohmann::json;

Error parse_format(const std::string& name, ExportFormat& out) {
    std::string upper;
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "CSV")  { out = ExportFormat::CSV;  return Error::Ok; }
    if (upper == "JSON") { out = ExportFormat::JSON; return Error::Ok; }
    if (upper == "TXT")  { out = ExportFormat::TXT;  return Error::Ok; }
    return Error::UnsupportedFormat;
}

const char* format_name(ExportFormat f) {
    switch (f) {
        case ExportFormat::CSV:  return "CSV";
        case ExportFormat::JSON: return "JSON";
        case ExportFormat::TXT:  return "TXT";
    }
    return "?";
}

const char* format_extension(ExportFormat f) {
    switch (f) {
        case ExportFormat::CSV:  return ".csv";
        case ExportFormat::JSON: return ".json";
        case ExportFormat::TXT:  return ".txt";
    }
    return "";
}

std::string format_timestamp(Timestamp ts, bool iso) {
    auto us = ts.time_since_epoch().count();
    time_t sec = static_cast<time_t>(us / 1000000);
    long frac = static_cast<long>(us % 1000000);
    if (frac < 0) {
        frac += 1000000;
        sec -= 1;
    }

    struct tm tm_local;
    localtime_r(&sec, &tm_local);

    char date[32];
    std::strftime(date, sizeof(date), iso ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S",
                  &tm_local);
    char buf[64];
    if (iso) {
        // Explicit offset so instants in a repeated DST hour stay distinct
        long off = tm_local.tm_gmtoff;
        char sign = off < 0 ? '-' : '+';
        if (off < 0) off = -off;
        std::snprintf(buf, sizeof(buf), "%s.%06ld%c%02ld:%02ld", date, frac, sign,
                      off / 3600, (off % 3600) / 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%s.%06ld", date, frac);
    }
    return buf;
}

bool parse_timestamp(const std::string& text, Timestamp& out) {
    struct tm tm_local;
    std::memset(&tm_local, 0, sizeof(tm_local));
    char sep = 0;
    int consumed = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                        &tm_local.tm_year, &tm_local.tm_mon, &tm_local.tm_mday, &sep,
                        &tm_local.tm_hour, &tm_local.tm_min, &tm_local.tm_sec, &consumed);
    if (n != 7 || (sep != ' ' && sep != 'T')) return false;

    long frac = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                frac = frac * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return false;
        for (int d = digits; d < 6; ++d) frac *= 10;
    }

    // Optional UTC offset: "Z", "+hh:mm" or "-hh:mm"
    bool has_offset = false;
    long offset_sec = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        has_offset = true;
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh = 0, om = 0, used = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &used) != 2 ||
            used != 5 || oh > 23 || om > 59) {
            return false;
        }
        offset_sec = (oh * 3600L + om * 60L) * (text[pos] == '-' ? -1 : 1);
        has_offset = true;
        pos += 1 + static_cast<size_t>(used);
    }
    if (pos != text.size()) return false;

    tm_local.tm_year -= 1900;
    tm_local.tm_mon -= 1;
    time_t sec;
    if (has_offset) {
        sec = ::timegm(&tm_local) - offset_sec;
    } else {
        // No offset: local time, ambiguous inside a repeated DST hour
        tm_local.tm_isdst = -1;
        sec = std::mktime(&tm_local);
        if (sec == static_cast<time_t>(-1)) return false;
    }

    out = Timestamp(std::chrono::microseconds(static_cast<int64_t>(sec) * 1000000 + frac));
    return true;
}

// --- CSV ---

static void append_csv_field(std::string& out, const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        out += field;
        return;
    }
    out += '"';
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
}

static void encode_csv(const std::vector<Measurement>& records, std::string& out) {
    out += CSV_HEADER;
    out += '\n';

    char value_buf[32];
    for (const auto& m : records) {
        out += format_timestamp(m.timestamp);
        out += ',';
        append_csv_field(out, m.device_name);
        out += ',';
        append_csv_field(out, m.function);
        out += ',';
        std::snprintf(value_buf, sizeof(value_buf), "%.15g", m.value);
        out += value_buf;
        out += ',';
        append_csv_field(out, m.unit);
        out += ',';
        out += status_name(m.status);
        out += ',';
        append_csv_field(out, m.user_label);
        out += '\n';
    }
}

// --- JSON ---

static void encode_json(const std::vector<Measurement>& records, std::string& out) {
    json arr = json::array();
    for (const auto& m : records) {
        arr.push_back({
            {"timestamp",   format_timestamp(m.timestamp, true)},
            {"device_name", m.device_name},
            {"function",    m.function},
            {"value",       m.value},
            {"unit",        m.unit},
            {"status",      status_name(m.status)},
            {"user_label",  m.user_label},
        });
    }
    // Replace invalid UTF-8 rather than throwing on odd instrument strings
    out += arr.dump(2, ' ', false, json::error_handler_t::replace);
    out += '\n';
}

// --- TXT ---

static void append_padded(std::string& out, const std::string& field, size_t width) {
    out += field;
    if (field.size() < width) out.append(width - field.size(), ' ');
}

static void append_txt_row(std::string& out, const std::string& ts, const std::string& device,
                           const std::string& function, const std::string& value,
                           const std::string& unit, const std::string& status,
                           const std::string& label) {
    append_padded(out, ts, 26);
    out += " | ";
    append_padded(out, device, 16);
    out += " | ";
    append_padded(out, function, 20);
    out += " | ";
    if (value.size() < 18) out.append(18 - value.size(), ' ');
    out += value;
    out += " | ";
    append_padded(out, unit, 6);
    out += " | ";
    append_padded(out, status, 6);
    out += " | ";
    out += label;
    out += '\n';
}

static void encode_txt(const std::vector<Measurement>& records, std::string& out) {
    out += "benchlog - Measurement Data Export\n";
    out += std::string(50, '=') + "\n";
    out += "Export Date: " + format_timestamp(now_timestamp()).substr(0, 19) + "\n";
    out += "Total Records: " + std::to_string(records.size()) + "\n\n";

    append_txt_row(out, "Timestamp", "Device", "Function", "Value", "Unit", "Status",
                   "User Label");
    out += std::string(120, '-') + "\n";

    // %.6f of the largest double is ~320 characters
    char value_buf[400];
    for (const auto& m : records) {
        std::snprintf(value_buf, sizeof(value_buf), "%.6f", m.value);
        append_txt_row(out, format_timestamp(m.timestamp), m.device_name, m.function,
                       value_buf, m.unit, status_name(m.status), m.user_label);
    }
}

Error encode(ExportFormat format, const std::vector<Measurement>& records, std::string& out) {
    if (records.empty()) return Error::NoData;

    std::string payload;
    switch (format) {
        case ExportFormat::CSV:  encode_csv(records, payload);  break;
        case ExportFormat::JSON: encode_json(records, payload); break;
        case ExportFormat::TXT:  encode_txt(records, payload);  break;
        default: return Error::UnsupportedFormat;
    }
    out.swap(payload);
    return Error::Ok;
}

Error export_measurements(const MeasurementStore& store, ExportFormat format,
                          const std::optional<std::string>& device, std::string& out) {
    std::vector<Measurement> records = store.query(device);
    Error err = encode(format, records, out);
    if (err == Error::NoData) {
        std::fprintf(stderr, "  [EXPORT] Nothing to export%s%s\n",
                     device ? " for " : "", device ? device->c_str() : "");
    }
    return err;
}

Error export_measurements(const MeasurementStore& store, const std::string& format,
                          const std::optional<std::string>& device, std::string& out) {
    ExportFormat f;
    if (parse_format(format, f) != Error::Ok) {
        std::fprintf(stderr, "  [EXPORT] Unsupported export format: %s\n", format.c_str());
        return Error::UnsupportedFormat;
    }
    return export_measurements(store, f, device, out);
}

// --- Import ---

static bool get_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

Error decode_json(const std::string& payload, std::vector<Measurement>& out) {
    json doc = json::parse(payload, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return Error::UnsupportedFormat;
    }

    std::vector<Measurement> records;
    records.reserve(doc.size());

    for (const auto& item : doc) {
        if (!item.is_object()) return Error::UnsupportedFormat;

        Measurement m;
        std::string ts, status;
        auto value = item.find("value");
        if (!get_string(item, "timestamp", ts) ||
            !get_string(item, "device_name", m.device_name) ||
            !get_string(item, "function", m.function) ||
            !get_string(item, "unit", m.unit) ||
            !get_string(item, "status", status) ||
            !get_string(item, "user_label", m.user_label) ||
            value == item.end() || !value->is_number()) {
            return Error::UnsupportedFormat;
        }
        if (!parse_timestamp(ts, m.timestamp)) return Error::UnsupportedFormat;

        m.value = value->get<double>();
        if (status == "OK") {
            m.status = MeasurementStatus::Ok;
        } else if (status == "ERROR") {
            m.status = MeasurementStatus::Error;
        } else {
            return Error::UnsupportedFormat;
        }
        records.push_back(std::move(m));
    }

    out.swap(records);
    return Error::Ok;
}

} // namespace benchlog
