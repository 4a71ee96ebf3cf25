#include "acquisition/events.hpp"
#include "acquisition/scheduler.hpp"
#include "export/encoder.hpp"
#include "export/file_writer.hpp"
#include "instrument/command_table.hpp"
#include "instrument/registry.hpp"
#include "storage/measurement_store.hpp"
#include "storage/statistics.hpp"
#include "streaming/protocol.hpp"
#include "streaming/server.hpp"
#include "transport/sim_transport.hpp"
#include "transport/socket_transport.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <memory>
#include <string>
#include <vector>
#include <time.h>

// Async-signal-safe shutdown flag
static volatile sig_atomic_t g_running = 1;

static void signal_handler(int /*sig*/) {
    g_running = 0;
}

static void sleep_sec(double sec) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>((sec - ts.tv_sec) * 1e9);
    nanosleep(&ts, nullptr);
}

// --- Argument parsing ---

struct Args {
    benchlog::Settings settings;
    std::vector<benchlog::DeviceConfig> devices;
    std::vector<std::string> commands;  // --send, run once per device before acquisition
    int duration_sec = 0;               // 0 = run until Ctrl+C
    std::string export_path;
    bool simulate = false;
    bool list = false;
    bool verbose = false;
    bool feed = true;
    std::string feed_host = "0.0.0.0";
    int feed_port = benchlog::DEFAULT_FEED_PORT;
};

static std::vector<std::string> split_fields(const char* str, size_t max_fields) {
    std::vector<std::string> out;
    std::string cur;
    for (const char* p = str; *p; ++p) {
        // The last field (user label) keeps any further commas
        if (*p == ',' && out.size() + 1 < max_fields) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur += *p;
        }
    }
    out.push_back(cur);
    return out;
}

static bool parse_device(const char* str, benchlog::DeviceConfig& out) {
    // Format: "name,address[,function[,range[,samples[,label]]]]"
    std::vector<std::string> f = split_fields(str, 6);
    if (f.size() < 2 || f[0].empty() || f[1].empty()) return false;

    out = benchlog::DeviceConfig{};
    out.name = f[0];
    out.address = f[1];
    out.function = f.size() > 2 && !f[2].empty() ? f[2] : "DC Voltage";
    if (f.size() > 3 && !f[3].empty()) out.range = f[3];
    if (f.size() > 4 && !f[4].empty()) {
        char* end = nullptr;
        long n = std::strtol(f[4].c_str(), &end, 10);
        if (*end != '\0' || n < 1) return false;
        out.sample_count = static_cast<int>(n);
    }
    if (f.size() > 5) out.user_label = f[5];
    return true;
}

static void print_usage(const char* prog) {
    std::printf("Usage: %s [--device name,address,function,range,samples,label ...]\n"
                "          [--interval MS] [--timeout SEC] [--max-points N] [--window SEC]\n"
                "          [--format csv|json|txt] [--export PATH] [--duration SEC]\n"
                "          [--send CMD ...] [--simulate] [--list] [--verbose]\n"
                "          [--feed-host ADDR] [--feed-port PORT] [--no-feed]\n\n"
                "Defaults: interval 1000 ms, timeout 5 s, 1000 cached points per device,\n"
                "          600 s display window (0 = none), CSV export\n"
                "          Live feed on 0.0.0.0:%d\n\n"
                "Device address: TCPIP0::host::port::SOCKET, host:port, or SIM::n (--simulate)\n"
                "Functions:\n",
                prog, benchlog::DEFAULT_FEED_PORT);
    for (const auto& name : benchlog::function_names()) {
        std::printf("  %-22s ranges:", name.c_str());
        for (const auto& r : benchlog::ranges_for(name)) {
            std::printf(" %s", r.c_str());
        }
        std::printf("\n");
    }
    std::printf("\n--send accepts a raw command or a common command name\n"
                "(Reset, Clear Status, Self Test, Identification, Operation Complete, Wait)\n"
                "--export PATH ending in .lz4 writes an LZ4-compressed file\n");
}

static bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--device") == 0 && i + 1 < argc) {
            benchlog::DeviceConfig cfg;
            if (!parse_device(argv[++i], cfg)) {
                std::fprintf(stderr, "Error: Invalid device '%s'\n", argv[i]);
                std::fprintf(stderr, "Expected: name,address[,function[,range[,samples[,label]]]]\n");
                return false;
            }
            args.devices.push_back(cfg);
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            args.settings.interval_ms = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            args.settings.timeout_sec = std::strtod(argv[++i], nullptr);
        } else if (std::strcmp(argv[i], "--max-points") == 0 && i + 1 < argc) {
            args.settings.max_points = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--window") == 0 && i + 1 < argc) {
            args.settings.window_sec = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--format") == 0 && i + 1 < argc) {
            if (benchlog::parse_format(argv[++i], args.settings.export_format) != benchlog::Error::Ok) {
                std::fprintf(stderr, "Error: Unsupported export format '%s'\n", argv[i]);
                return false;
            }
        } else if (std::strcmp(argv[i], "--export") == 0 && i + 1 < argc) {
            args.export_path = argv[++i];
        } else if (std::strcmp(argv[i], "--duration") == 0 && i + 1 < argc) {
            args.duration_sec = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--send") == 0 && i + 1 < argc) {
            args.commands.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--simulate") == 0) {
            args.simulate = true;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            args.list = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            args.verbose = true;
        } else if (std::strcmp(argv[i], "--feed-host") == 0 && i + 1 < argc) {
            args.feed_host = argv[++i];
        } else if (std::strcmp(argv[i], "--feed-port") == 0 && i + 1 < argc) {
            args.feed_port = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--no-feed") == 0) {
            args.feed = false;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::fprintf(stderr, "Error: Unknown or incomplete option '%s' (see --help)\n", argv[i]);
            return false;
        }
    }

    if (args.settings.interval_ms <= 0 || args.settings.timeout_sec <= 0 ||
        args.settings.max_points == 0 || args.settings.window_sec < 0) {
        std::fprintf(stderr, "Error: interval, timeout and max-points must be positive, "
                     "window must be >= 0\n");
        return false;
    }

    // Simulation with no explicit devices: one meter per simulated address
    if (args.simulate && args.devices.empty()) {
        static const char* SIM_FUNCTIONS[] = {
            "DC Voltage", "AC Voltage", "Resistance (2-wire)", "Temperature",
        };
        for (int i = 0; i < 4; ++i) {
            benchlog::DeviceConfig cfg;
            cfg.name = "DMM" + std::to_string(i + 1);
            cfg.address = "SIM::" + std::to_string(i + 1);
            cfg.function = SIM_FUNCTIONS[i];
            args.devices.push_back(cfg);
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        return 1;
    }
    const benchlog::Settings& settings = args.settings;

    // --- Transport ---
    std::unique_ptr<benchlog::Transport> transport;
    if (args.simulate) {
        transport = std::make_unique<benchlog::SimTransport>();
    } else {
        std::vector<std::string> addresses;
        for (const auto& d : args.devices) {
            addresses.push_back(d.address);
        }
        transport = std::make_unique<benchlog::SocketTransport>(addresses);
    }

    if (args.list) {
        std::printf("Available addresses:\n");
        for (const auto& a : transport->list_addresses()) {
            std::printf("  %s\n", a.c_str());
        }
        return 0;
    }

    if (args.devices.empty()) {
        std::fprintf(stderr, "Error: No devices given (use --device or --simulate, see --help)\n");
        return 1;
    }

    std::printf("\n============================================================\n"
                "BENCHLOG INSTRUMENT LOGGER\n"
                "============================================================\n"
                "Config: %zu devices, interval %d ms, timeout %.1f s\n"
                "Cache:  %zu points/device, window %d s\n"
                "Feed:   %s\n\n",
                args.devices.size(), settings.interval_ms, settings.timeout_sec,
                settings.max_points, settings.window_sec,
                args.feed ? (args.feed_host + ":" + std::to_string(args.feed_port)).c_str()
                          : "disabled");

    // --- Signal handling ---
    // SIGPIPE: disconnected TCP peer must not kill the process
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // --- Event consumers ---
    benchlog::EventBus bus;
    benchlog::MeasurementStore store(settings.max_points);
    benchlog::ConsoleEventLog console(args.verbose);
    bus.subscribe(&store);
    bus.subscribe(&console);

    benchlog::InstrumentRegistry registry(*transport, bus, settings.timeout_sec);

    std::unique_ptr<benchlog::FeedServer> feed;
    if (args.feed) {
        feed = std::make_unique<benchlog::FeedServer>([&registry, &settings]() {
            return benchlog::build_metadata_json(registry.configs(), settings.interval_ms);
        });
        if (feed->start(args.feed_host, args.feed_port)) {
            bus.subscribe(feed.get());
        } else {
            std::fprintf(stderr, "  [FEED] Live feed disabled\n");
            feed.reset();
        }
    }

    // --- Configure + connect ---
    std::printf("Connecting instruments...\n");
    int connected = 0;
    for (const auto& cfg : args.devices) {
        benchlog::Error err = registry.add_or_update(cfg);
        if (err == benchlog::Error::ConfigError) continue;

        if (registry.connect(cfg.name, cfg.address) == benchlog::Error::Ok) {
            connected++;
        }
        if (!g_running) break;
    }

    if (!g_running) {
        std::printf("\n[CANCELLED] Ctrl+C during connect\n");
        if (feed) {
            bus.unsubscribe(feed.get());
            feed->stop();
        }
        registry.shutdown();
        return 1;
    }

    std::printf("\n  %d/%zu devices connected\n", connected, args.devices.size());

    for (const auto& cmd : args.commands) {
        const char* common = benchlog::common_command(cmd);
        std::string command = common ? common : cmd;
        for (const auto& name : registry.list_connected()) {
            std::string reply;
            registry.send_command(name, command, reply);
        }
    }

    // --- Acquisition ---
    benchlog::AcquisitionScheduler scheduler(registry, bus, settings.timeout_sec);
    if (scheduler.start(settings.interval_ms) != benchlog::Error::Ok) {
        std::fprintf(stderr, "\n[FAIL] Nothing to acquire\n");
        if (feed) {
            bus.unsubscribe(feed.get());
            feed->stop();
        }
        registry.shutdown();
        return 1;
    }

    std::printf("\n============================================================\n"
                "[OK] ACQUIRING -- Ctrl+C to stop%s\n"
                "============================================================\n",
                args.duration_sec > 0 ? " (timed run)" : "");

    double elapsed = 0;
    while (g_running && (args.duration_sec <= 0 || elapsed < args.duration_sec)) {
        sleep_sec(0.1);
        elapsed += 0.1;
    }

    // --- Shutdown ---
    std::printf("\n\nShutting down...\n");
    scheduler.stop();

    if (feed) {
        auto fs = feed->get_stats();
        std::printf("  [FEED] sent=%lu batches=%lu drops=%lu clients=%lu\n",
                    static_cast<unsigned long>(fs.events_sent),
                    static_cast<unsigned long>(fs.batches_sent),
                    static_cast<unsigned long>(fs.drops),
                    static_cast<unsigned long>(fs.clients));
        bus.unsubscribe(feed.get());
        feed->stop();
    }

    registry.shutdown();

    // Live-display view of the cache at shutdown
    auto window = benchlog::window_from_seconds(settings.window_sec);
    for (const auto& name : store.device_names()) {
        benchlog::SeriesStats ss = benchlog::series_stats(store, name, window);
        std::printf("  [RECENT] %-16s n=%zu mean=%.6g sd=%.3g min=%.6g max=%.6g\n",
                    name.c_str(), ss.count, ss.mean, ss.stddev, ss.min, ss.max);
    }

    benchlog::print_session_stats(benchlog::compute_stats(store));

    int rc = 0;
    if (!args.export_path.empty()) {
        benchlog::Error err = benchlog::export_to_file(store, settings.export_format,
                                                       std::nullopt, args.export_path);
        if (err != benchlog::Error::Ok) {
            std::fprintf(stderr, "  [EXPORT] Export to %s failed: %s\n",
                         args.export_path.c_str(), benchlog::error_name(err));
            rc = 1;
        }
    }

    std::printf("Done.\n");
    return rc;
}
