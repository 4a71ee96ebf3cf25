#pragma once

#include "instrument/errors.hpp"

#include <memory>
#include <string>
#include <vector>

namespace benchlog {

// One open connection to one instrument.
// query() and close() are never called concurrently (the registry serializes
// them per device). abort() may be called from any thread at any time.
class Session {
public:
    virtual ~Session() = default;

    // Send a command and read one reply line (terminator stripped).
    // Blocks at most timeout_sec.
    virtual QueryStatus query(const std::string& command, double timeout_sec,
                              std::string& reply) = 0;

    // Make an in-flight query() return Closed promptly; later queries fail fast.
    virtual void abort() = 0;

    // Release the underlying resource. Idempotent.
    virtual void close() = 0;

    virtual const std::string& address() const = 0;
};

// Bus / resource manager abstraction. open() may be called from several threads.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::vector<std::string> list_addresses() = 0;

    // On failure returns ConnectionError (or ConfigError for a malformed
    // address) and fills detail with a human-readable reason.
    virtual Error open(const std::string& address, std::unique_ptr<Session>& out,
                       std::string& detail) = 0;
};

} // namespace benchlog
