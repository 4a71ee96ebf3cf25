#pragma once

#include "instrument/errors.hpp"
#include "instrument/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace benchlog {

class EventBus;
class Session;
class Transport;

// Snapshot of one device's registry state
struct DeviceStatus {
    bool        connected = false;
    bool        configured = false;
    bool        enabled = false;
    std::string address;
    std::string identity;      // *IDN? reply captured at connect
    std::string function;
    std::string range;
    int         sample_count = 0;
    std::string resolved_command;
};

// Owns device configurations and open sessions.
//
// Locking: mutex_ guards the two maps and is never held across I/O.
// Each connected device has a SessionSlot whose io_mutex serializes every
// use of that device's Session (tick queries, ad-hoc commands, close), so a
// slow query on one device never blocks another device.
// disconnect() aborts the session first, so an outstanding query for that
// device fails fast instead of holding the slot until its timeout.
class InstrumentRegistry {
public:
    InstrumentRegistry(Transport& transport, EventBus& bus,
                       double timeout_sec = DEFAULT_TIMEOUT_SEC);
    ~InstrumentRegistry();

    InstrumentRegistry(const InstrumentRegistry&) = delete;
    InstrumentRegistry& operator=(const InstrumentRegistry&) = delete;

    // Insert or replace (by name) a configuration; resolved_command is
    // recomputed. The config is stored even when the function or range is
    // bad: UnknownFunction leaves an empty command (device is never polled),
    // InvalidRange falls back to the autorange query.
    Error add_or_update(const DeviceConfig& config);

    // NotFound if absent; never aborts a bulk operation
    Error remove(const std::string& name);

    // Open + identify (*IDN?). Reconnecting a name at the same address closes
    // the previous session first. A different address needs disconnect() first.
    Error connect(const std::string& name, const std::string& address);

    // Closes the session and drops the device's configuration. NotFound if
    // the device is not connected.
    Error disconnect(const std::string& name);

    // Disconnect everything (process teardown)
    void shutdown();

    std::set<std::string> list_connected() const;
    std::vector<std::string> list_addresses();

    // Enabled + connected + non-empty command, read fresh by every tick
    std::vector<DeviceConfig> active_devices() const;

    std::vector<DeviceConfig> configs() const;
    bool get_config(const std::string& name, DeviceConfig& out) const;
    DeviceStatus status(const std::string& name) const;

    // Query a connected device, serialized with every other use of its
    // session. Returns Closed if the device is not connected.
    QueryStatus query(const std::string& name, const std::string& command,
                      double timeout_sec, std::string& reply);

    // Ad-hoc command with the default timeout (logged)
    QueryStatus send_command(const std::string& name, const std::string& command,
                             std::string& reply);

    double timeout_sec() const { return timeout_sec_; }

private:
    struct SessionSlot {
        std::mutex io_mutex;
        std::unique_ptr<Session> session;
        std::string address;
        std::string identity;
    };

    // Abort, then close under the slot's io_mutex
    static void close_slot(SessionSlot& slot);

    Transport& transport_;
    EventBus& bus_;
    double timeout_sec_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceConfig> configs_;
    std::map<std::string, std::shared_ptr<SessionSlot>> sessions_;
    std::set<std::string> connecting_;
};

} // namespace benchlog
