#include "bluez.hpp"

#include <protocol/layout.hpp>
#include <protocol/packets.hpp>
#include <protocol/parse.hpp>
#include <scanner/scan_session.hpp>
#include <types/device.hpp>

#include <poll.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

static std::atomic<bool> g_running{true};

// Signal handler
static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

struct ScanOptions {
    bool keep_previous = false;
    bool allow_duplicates = false;
    int timeout_seconds = 0;  // 0 = until interrupted
};

static DBusConnection* connect_system_bus() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// Poll the system bus until the deadline or until interrupted
static void run_event_loop(bluez::Central& central, std::chrono::steady_clock::time_point deadline,
                           bool has_deadline) {
    while (g_running) {
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            break;
        }

        pollfd pfd = {};
        pfd.fd = central.get_fd();
        pfd.events = POLLIN;

        // Poll with 100ms timeout
        int ret = poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        // Also flushes outgoing calls and runs pending reply handlers
        central.process_pending();
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_scan(const ScanOptions& options) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    DBusConnection* conn = connect_system_bus();
    if (!conn) return 1;

    int result = 0;
    {
        bluez::Central central(conn);
        central.refresh();

        pixels::ScanSession session(central);
        bool start_requested = false;

        auto start_scan = [&]() {
            if (start_requested || !session.is_bluetooth_on()) return;
            start_requested = true;
            session.start(options.keep_previous, options.allow_duplicates);
        };

        pixels::ScanCallbacks listener;
        listener.on_bluetooth_state_changed = [&](pixels::BluetoothState state) {
            std::cout << "Bluetooth: " << pixels::to_string(state) << std::endl;
            if (pixels::is_bluetooth_on(state)) {
                start_scan();
            } else {
                // Scan again once the adapter comes back
                start_requested = false;
            }
        };
        listener.on_scanning_state_changed = [](bool is_scanning) {
            std::cout << (is_scanning ? "Scanning..." : "Scan stopped") << std::endl;
        };
        listener.on_pixel_discovered = [&](const pixels::ScannedPixel& pixel) {
            std::cout << "+ " << pixels::to_string(pixel) << std::endl;
            // Keep a handle so the die can be connected to later
            session.get_pixel(pixel);
        };
        listener.on_pixel_updated = [](const pixels::ScannedPixel& pixel) {
            std::cout << "~ " << pixels::to_string(pixel) << std::endl;
        };
        session.add_listener(&listener);

        bluez::Callbacks bluez_callbacks;
        bluez_callbacks.on_state_changed = [&](pixels::BluetoothState state) {
            session.handle_state_changed(state);
        };
        bluez_callbacks.on_advertisement = [&](const pixels::RawAdvertisement& advertisement) {
            session.handle_advertisement(advertisement);
        };
        central.set_callbacks(&bluez_callbacks);

        std::cout << "Bluetooth: " << pixels::to_string(session.bluetooth_state()) << std::endl;
        if (!session.is_bluetooth_on()) {
            std::cout << "Waiting for Bluetooth to be turned on..." << std::endl;
        }
        start_scan();

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.timeout_seconds);
        run_event_loop(central, deadline, options.timeout_seconds > 0);

        if (session.is_scanning()) {
            session.stop();
            central.process_pending();
        }

        auto scanned = session.scanned_pixels();
        std::cout << "Found " << scanned.size() << " Pixels dice" << std::endl;
        for (const auto& pixel : scanned) {
            std::cout << "  " << pixels::to_string(pixel) << std::endl;
        }

        if (session.bluetooth_state() != pixels::BluetoothState::On && scanned.empty()) {
            result = 1;
        }

        central.set_callbacks(nullptr);
        session.remove_listener(&listener);
    }

    dbus_connection_unref(conn);
    return result;
}

static int cmd_state() {
    DBusConnection* conn = connect_system_bus();

    pixels::BluetoothState state;
    std::optional<std::string> adapter;
    {
        bluez::Central central(conn);
        central.refresh();
        state = central.state();
        adapter = central.adapter_path();
    }

    std::cout << "Bluetooth: " << pixels::to_string(state) << std::endl;
    if (adapter) {
        std::cout << "Adapter: " << *adapter << std::endl;
    }

    if (conn) dbus_connection_unref(conn);
    return conn ? 0 : 1;
}

static int cmd_decode(const char* manufacturer_hex, const char* service_hex) {
    auto manufacturer = pixels::packets::parse_hex(manufacturer_hex);
    auto service = pixels::packets::parse_hex(service_hex);
    if (!manufacturer || !service) {
        std::cerr << "Invalid hex payload" << std::endl;
        return 1;
    }

    pixels::RawAdvertisement advertisement;
    advertisement.manufacturer_data = std::move(*manufacturer);
    advertisement.service_data[pixels::packets::PIXELS_SERVICE_UUID] = std::move(*service);

    pixels::DecodeError error = pixels::DecodeError::None;
    auto pixel = pixels::parse::interpret(advertisement, &error);
    if (!pixel) {
        std::cerr << "Decode failed: " << pixels::to_string(error) << std::endl;
        return 1;
    }

    std::cout << pixels::to_string(*pixel) << std::endl;
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  scan [options]               Scan for Pixels dice\n"
              << "      --keep                   Keep dice found by a previous scan\n"
              << "      --duplicates             Report every advertisement\n"
              << "      --timeout <seconds>      Stop after the given time\n"
              << "  state                        Show Bluetooth availability\n"
              << "  decode <manuf-hex> <serv-hex> Decode advertisement payloads\n"
              << "  help                         Show this help\n";
}

static bool parse_scan_options(int argc, char* argv[], ScanOptions* options) {
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--keep") {
            options->keep_previous = true;
        } else if (arg == "--duplicates") {
            options->allow_duplicates = true;
        } else if (arg == "--timeout" && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                             options->timeout_seconds);
            if (ec != std::errc() || ptr != value.data() + value.size() ||
                options->timeout_seconds < 0) {
                std::cerr << "Invalid timeout: " << value << std::endl;
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "scan") {
        ScanOptions options;
        if (!parse_scan_options(argc, argv, &options)) {
            print_usage(argv[0]);
            return 1;
        }
        return cmd_scan(options);
    } else if (cmd == "state") {
        return cmd_state();
    } else if (cmd == "decode") {
        if (argc < 4) {
            std::cerr << "Usage: " << argv[0] << " decode <manufacturer-hex> <service-hex>\n";
            return 1;
        }
        return cmd_decode(argv[2], argv[3]);
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
