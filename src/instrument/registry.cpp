#include "instrument/registry.hpp"
#include "instrument/command_table.hpp"
#include "acquisition/events.hpp"
#include "transport/transport.hpp"

#include <cstdio>

namespace benchlog {

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

InstrumentRegistry::InstrumentRegistry(Transport& transport, EventBus& bus,
                                       double timeout_sec)
    : transport_(transport)
    , bus_(bus)
    , timeout_sec_(timeout_sec)
{}

InstrumentRegistry::~InstrumentRegistry() {
    shutdown();
}

void InstrumentRegistry::close_slot(SessionSlot& slot) {
    if (slot.session) {
        slot.session->abort();
    }
    std::lock_guard<std::mutex> io(slot.io_mutex);
    if (slot.session) {
        slot.session->close();
        slot.session.reset();
    }
}

Error InstrumentRegistry::add_or_update(const DeviceConfig& config) {
    if (is_blank(config.name)) {
        std::fprintf(stderr, "  [REGISTRY] Rejected config with blank device name\n");
        return Error::ConfigError;
    }
    if (config.sample_count < 1) {
        std::fprintf(stderr, "  [REGISTRY] %s: sample count must be >= 1 (got %d)\n",
                     config.name.c_str(), config.sample_count);
        return Error::ConfigError;
    }

    DeviceConfig stored = config;
    Error resolve = resolve_command(stored.function, stored.range, stored.resolved_command);

    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_blank(stored.address)) {
        for (const auto& kv : configs_) {
            if (kv.first != stored.name && kv.second.address == stored.address) {
                std::fprintf(stderr, "  [REGISTRY] %s: address %s already used by %s\n",
                             stored.name.c_str(), stored.address.c_str(), kv.first.c_str());
                return Error::ConfigError;
            }
        }
    }

    configs_[stored.name] = stored;

    if (resolve == Error::UnknownFunction) {
        std::fprintf(stderr, "  [REGISTRY] %s: unknown function '%s' -- device will not be polled\n",
                     stored.name.c_str(), stored.function.c_str());
    } else if (resolve == Error::InvalidRange) {
        std::fprintf(stderr, "  [REGISTRY] %s: range '%s' invalid for %s -- using autorange\n",
                     stored.name.c_str(), stored.range.c_str(), stored.function.c_str());
    } else {
        std::printf("  [REGISTRY] %s: %s, range %s -> %s\n",
                    stored.name.c_str(), stored.function.c_str(), stored.range.c_str(),
                    stored.resolved_command.c_str());
    }
    return resolve;
}

Error InstrumentRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configs_.erase(name) == 0) {
        return Error::NotFound;
    }
    std::printf("  [REGISTRY] Removed config for %s\n", name.c_str());
    return Error::Ok;
}

Error InstrumentRegistry::connect(const std::string& name, const std::string& address) {
    if (is_blank(name) || is_blank(address)) {
        std::fprintf(stderr, "  [REGISTRY] connect: blank %s rejected\n",
                     is_blank(name) ? "device name" : "address");
        return Error::ConfigError;
    }

    std::shared_ptr<SessionSlot> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (connecting_.count(name)) {
            std::fprintf(stderr, "  [REGISTRY] %s: connect already in progress\n", name.c_str());
            return Error::ConfigError;
        }

        for (const auto& kv : sessions_) {
            if (kv.first != name && kv.second->address == address) {
                std::fprintf(stderr, "  [REGISTRY] %s: %s is already connected as %s\n",
                             name.c_str(), address.c_str(), kv.first.c_str());
                return Error::ConfigError;
            }
        }

        auto it = sessions_.find(name);
        if (it != sessions_.end()) {
            if (it->second->address != address) {
                std::fprintf(stderr, "  [REGISTRY] %s: connected to %s -- disconnect before "
                             "connecting to %s\n",
                             name.c_str(), it->second->address.c_str(), address.c_str());
                return Error::ConfigError;
            }
            previous = it->second;
            sessions_.erase(it);
        }
        connecting_.insert(name);
    }

    // Reconnect: never leave the old session open
    if (previous) {
        std::printf("  [REGISTRY] %s: closing previous session before reconnect\n", name.c_str());
        close_slot(*previous);
    }

    auto slot = std::make_shared<SessionSlot>();
    slot->address = address;

    std::string detail;
    Error err = transport_.open(address, slot->session, detail);
    if (err == Error::Ok) {
        QueryStatus st = slot->session->query(CMD_IDENTIFY, timeout_sec_, slot->identity);
        if (st != QueryStatus::Ok) {
            detail = std::string("no reply to *IDN? (") + query_status_name(st) + ")";
            slot->session->close();
            slot->session.reset();
            err = Error::ConnectionError;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_.erase(name);
        if (err == Error::Ok) {
            sessions_[name] = slot;
            auto cfg = configs_.find(name);
            if (cfg != configs_.end() && is_blank(cfg->second.address)) {
                cfg->second.address = address;
            }
        }
    }

    // Publish outside mutex_
    if (err != Error::Ok) {
        std::fprintf(stderr, "  [REGISTRY] Failed to connect %s at %s: %s\n",
                     name.c_str(), address.c_str(), detail.c_str());
        bus_.publish(make_device_event(EventType::DeviceError, name, detail));
        return err;
    }

    std::printf("  [REGISTRY] Connected %s at %s: %s\n",
                name.c_str(), address.c_str(), slot->identity.c_str());
    bus_.publish(make_device_event(EventType::DeviceConnected, name, slot->identity));
    return Error::Ok;
}

Error InstrumentRegistry::disconnect(const std::string& name) {
    std::shared_ptr<SessionSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) {
            std::printf("  [REGISTRY] Device %s not found\n", name.c_str());
            return Error::NotFound;
        }
        slot = it->second;
        sessions_.erase(it);
        configs_.erase(name);
    }

    close_slot(*slot);

    std::printf("  [REGISTRY] Disconnected %s\n", name.c_str());
    bus_.publish(make_device_event(EventType::DeviceDisconnected, name, ""));
    return Error::Ok;
}

void InstrumentRegistry::shutdown() {
    for (const auto& name : list_connected()) {
        disconnect(name);
    }
}

std::set<std::string> InstrumentRegistry::list_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> out;
    for (const auto& kv : sessions_) {
        out.insert(kv.first);
    }
    return out;
}

std::vector<std::string> InstrumentRegistry::list_addresses() {
    return transport_.list_addresses();
}

std::vector<DeviceConfig> InstrumentRegistry::active_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceConfig> out;
    for (const auto& kv : configs_) {
        const DeviceConfig& c = kv.second;
        if (c.enabled && !c.resolved_command.empty() && sessions_.count(kv.first)) {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<DeviceConfig> InstrumentRegistry::configs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceConfig> out;
    out.reserve(configs_.size());
    for (const auto& kv : configs_) {
        out.push_back(kv.second);
    }
    return out;
}

bool InstrumentRegistry::get_config(const std::string& name, DeviceConfig& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end()) return false;
    out = it->second;
    return true;
}

DeviceStatus InstrumentRegistry::status(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceStatus s;

    auto sit = sessions_.find(name);
    if (sit != sessions_.end()) {
        s.connected = true;
        s.address = sit->second->address;
        s.identity = sit->second->identity;
    }

    auto cit = configs_.find(name);
    if (cit != configs_.end()) {
        const DeviceConfig& c = cit->second;
        s.configured = true;
        s.enabled = c.enabled;
        s.function = c.function;
        s.range = c.range;
        s.sample_count = c.sample_count;
        s.resolved_command = c.resolved_command;
        if (!s.connected) s.address = c.address;
    }
    return s;
}

QueryStatus InstrumentRegistry::query(const std::string& name, const std::string& command,
                                      double timeout_sec, std::string& reply) {
    std::shared_ptr<SessionSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) {
            reply.clear();
            return QueryStatus::Closed;
        }
        slot = it->second;
    }

    std::lock_guard<std::mutex> io(slot->io_mutex);
    if (!slot->session) {
        reply.clear();
        return QueryStatus::Closed;
    }
    return slot->session->query(command, timeout_sec, reply);
}

QueryStatus InstrumentRegistry::send_command(const std::string& name, const std::string& command,
                                             std::string& reply) {
    QueryStatus st = query(name, command, timeout_sec_, reply);
    if (st == QueryStatus::Ok) {
        std::printf("  [REGISTRY] %s: %s -> %s\n", name.c_str(), command.c_str(), reply.c_str());
    } else {
        std::fprintf(stderr, "  [REGISTRY] %s: %s failed: %s\n",
                     name.c_str(), command.c_str(), query_status_name(st));
    }
    return st;
}

} // namespace benchlog
