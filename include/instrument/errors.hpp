#pragma once

namespace benchlog {

// Failure outcome of every fallible benchlog operation.
// Acquisition-time faults never surface through this; they become events.
enum class Error {
    Ok = 0,
    ConfigError,          // Blank/duplicate name or address, rejected before any I/O
    NotFound,             // No such device (remove/disconnect are idempotent on this)
    ConnectionError,      // Transport open/identify/close failure
    NoDevicesConfigured,  // start() with nothing enabled + connected
    UnknownFunction,      // Function name not in the command table
    InvalidRange,         // Range token not valid for the function
    NoData,               // Export of an empty (filtered) log
    UnsupportedFormat,    // Export format not CSV/JSON/TXT
    IOFailure,            // Export file could not be written
};

inline const char* error_name(Error e) {
    switch (e) {
        case Error::Ok:                  return "ok";
        case Error::ConfigError:         return "configuration error";
        case Error::NotFound:            return "not found";
        case Error::ConnectionError:     return "connection error";
        case Error::NoDevicesConfigured: return "no devices configured";
        case Error::UnknownFunction:     return "unknown function";
        case Error::InvalidRange:        return "invalid range";
        case Error::NoData:              return "no data";
        case Error::UnsupportedFormat:   return "unsupported format";
        case Error::IOFailure:           return "I/O failure";
    }
    return "unknown error";
}

// Outcome of a single transport query
enum class QueryStatus {
    Ok = 0,
    Timeout,
    IOFailure,
    Closed,     // Session closed or aborted (possibly concurrently)
};

inline const char* query_status_name(QueryStatus s) {
    switch (s) {
        case QueryStatus::Ok:        return "ok";
        case QueryStatus::Timeout:   return "timeout";
        case QueryStatus::IOFailure: return "I/O failure";
        case QueryStatus::Closed:    return "session closed";
    }
    return "unknown";
}

} // namespace benchlog
