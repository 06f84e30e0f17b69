#pragma once

#include "notifier.hpp"
#include "registry.hpp"
#include "transport.hpp"
#include "../types/advertisement.hpp"
#include "../types/bluetooth_state.hpp"
#include "../types/device.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pixels {

// Scans for Pixels dice and keeps one snapshot per die, in discovery order.
//
// All state is guarded by one mutex. Advertisements are decoded before it is
// taken. Notifications are queued while it is held and delivered once it is
// released, so listeners may call back into the session.
//
// Transport commands are issued with the lock held: the transport must not
// call handle_state_changed() or handle_advertisement() synchronously from
// begin_discovery() or end_discovery().
class ScanSession {
public:
    // transport must outlive the session
    explicit ScanSession(Transport& transport);

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    void add_listener(const ScanCallbacks* listener);
    void remove_listener(const ScanCallbacks* listener);

    // Start discovering dice. Unless keep_previous is set the list of scanned
    // dice is cleared first. Requires Bluetooth to be on to find anything.
    void start(bool keep_previous = false, bool allow_duplicates = false);
    void stop();

    // Empty the list of scanned dice, pixel handles are kept
    void clear();

    BluetoothState bluetooth_state() const;
    bool is_bluetooth_on() const;
    bool is_scanning() const;
    std::vector<ScannedPixel> scanned_pixels() const;
    std::optional<ScannedPixel> find(uint32_t pixel_id) const;

    // Handle for the die, created on first request
    std::shared_ptr<Pixel> get_pixel(const ScannedPixel& scanned);

    // Transport events
    void handle_state_changed(BluetoothState state);
    void handle_advertisement(const RawAdvertisement& advertisement);

private:
    void set_scanning(bool is_scanning);

    Transport& transport_;
    PixelRegistry registry_;
    Notifier notifier_;

    mutable std::mutex mutex_;
    BluetoothState bluetooth_state_;
    bool scan_requested_ = false;  // between start() and stop()
    bool scanning_ = false;
    std::vector<ScannedPixel> scanned_pixels_;
};

} // namespace pixels
