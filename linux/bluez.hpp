#pragma once

#include <scanner/transport.hpp>
#include <types/advertisement.hpp>
#include <types/bluetooth_state.hpp>

#include <dbus/dbus.h>
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bluez {

constexpr const char* SERVICE_NAME = "org.bluez";
constexpr const char* ADAPTER_INTERFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_INTERFACE = "org.bluez.Device1";

// Timeout for blocking D-Bus calls and pending replies
constexpr int CALL_TIMEOUT_MS = 5000;

// Callbacks for BlueZ events
struct Callbacks {
    // Adapter availability or discovery state changed
    std::function<void(pixels::BluetoothState)> on_state_changed;

    // A device advertising the filtered service updated its advertisement
    std::function<void(const pixels::RawAdvertisement&)> on_advertisement;
};

// BLE central on top of the BlueZ D-Bus API (first adapter found)
//
// Not thread-safe: construct, refresh and dispatch from the thread running
// the D-Bus event loop. state() and is_scanning() may be read from any thread.
class Central : public pixels::Transport {
public:
    // conn may be null (no system bus), the state is then Unknown
    explicit Central(DBusConnection* conn);
    ~Central() override;

    Central(const Central&) = delete;
    Central& operator=(const Central&) = delete;

    // Callbacks are not owned, pass nullptr to detach
    void set_callbacks(const Callbacks* callbacks);

    // Re-read the adapter and known devices from BlueZ
    void refresh();

    pixels::BluetoothState state() const override;
    bool is_scanning() const override;
    void begin_discovery(const std::string& service_uuid, bool allow_duplicates) override;
    void end_discovery() override;

    const std::optional<std::string>& adapter_path() const { return adapter_path_; }

    // Process a D-Bus message that might be a BlueZ signal
    // Returns true if it was handled. Exceptions thrown by callbacks are
    // logged and stop here, this runs inside libdbus dispatch.
    bool handle_signal(DBusMessage* msg);

    // Process pending D-Bus messages (call in event loop)
    void process_pending();

    // Get file descriptor for polling, -1 without connection
    int get_fd() const;

private:
    struct Device {
        pixels::RawAdvertisement advertisement;
        std::vector<std::string> uuids;
    };

    static DBusHandlerResult filter(DBusConnection* conn, DBusMessage* msg, void* data);
    bool dispatch_signal(DBusMessage* msg);

    void set_state(pixels::BluetoothState state, bool discovering);
    void update_adapter_state();
    void adopt_adapter(const char* path, DBusMessageIter* props);
    void handle_interfaces_added(DBusMessageIter* iter);
    void handle_interfaces_removed(DBusMessageIter* iter);
    void handle_properties_changed(const char* path, DBusMessageIter* iter);

    bool apply_adapter_properties(DBusMessageIter* props);
    bool apply_device_properties(Device& device, DBusMessageIter* props);
    Device& device_for(const std::string& path);
    void fetch_device(const std::string& path, Device& device);
    void notify_advertisement(const Device& device);

    DBusConnection* conn_;
    const Callbacks* callbacks_ = nullptr;
    bool filter_installed_ = false;

    std::optional<std::string> adapter_path_;
    bool powered_ = false;
    bool adapter_discovering_ = false;  // any BlueZ client is discovering

    // Set by begin_discovery(), cleared by end_discovery() and when the
    // adapter is powered off or lost
    bool discovery_requested_ = false;

    // Reported values, changed through set_state()
    std::atomic<pixels::BluetoothState> state_{pixels::BluetoothState::Unknown};
    std::atomic<bool> discovering_{false};

    // Lowercase UUID of the current discovery filter
    std::string service_filter_;

    std::unordered_map<std::string, Device> devices_;
};

} // namespace bluez
