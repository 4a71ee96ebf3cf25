#pragma once

#include "instrument/errors.hpp"
#include "instrument/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace benchlog {

class MeasurementStore;

// CSV header row (stable)
constexpr const char* CSV_HEADER = "Timestamp,Device,Function,Value,Unit,Status,User Label";

// "csv" / "JSON" / "Txt" ... (case-insensitive). UnsupportedFormat otherwise.
Error parse_format(const std::string& name, ExportFormat& out);

const char* format_name(ExportFormat f);        // "CSV"
const char* format_extension(ExportFormat f);   // ".csv"

// Local time, microsecond precision:
//   "YYYY-MM-DD HH:MM:SS.ffffff"          (iso = false, CSV/TXT)
//   "YYYY-MM-DDTHH:MM:SS.ffffff+hh:mm"    (iso = true, JSON and live feed)
std::string format_timestamp(Timestamp ts, bool iso = false);

// Accepts both forms above; fractional part optional (1-6 digits), offset
// optional ("Z" or +/-hh:mm). Without an offset the text is read as local time.
bool parse_timestamp(const std::string& text, Timestamp& out);

// Render records in the given format. NoData if records is empty.
Error encode(ExportFormat format, const std::vector<Measurement>& records, std::string& out);

// Snapshot the store (optionally one device) and render it.
// NoData if the filtered log is empty; out is left untouched on failure.
Error export_measurements(const MeasurementStore& store, ExportFormat format,
                          const std::optional<std::string>& device, std::string& out);

Error export_measurements(const MeasurementStore& store, const std::string& format,
                          const std::optional<std::string>& device, std::string& out);

// Re-import a JSON export. UnsupportedFormat if the payload is not a JSON
// array of measurement objects.
Error decode_json(const std::string& payload, std::vector<Measurement>& out);

} // namespace benchlog
