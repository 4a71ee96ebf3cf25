#pragma once

#include "instrument/errors.hpp"
#include "instrument/types.hpp"

#include <optional>
#include <string>

namespace benchlog {

class MeasurementStore;

// Write payload to path atomically: a temporary file in the same directory is
// written, fsync'd and renamed over path. Paths ending in ".lz4" are written
// as one LZ4 frame. On failure returns IOFailure and nothing is left at path
// (a previous file at path is untouched).
Error write_export_file(const std::string& path, const std::string& payload);

// export_measurements() + write_export_file(). NoData/UnsupportedFormat
// write nothing.
Error export_to_file(const MeasurementStore& store, ExportFormat format,
                     const std::optional<std::string>& device, const std::string& path);

} // namespace benchlog
