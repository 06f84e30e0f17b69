#include "scan_session.hpp"
#include "../protocol/packets.hpp"
#include "../protocol/parse.hpp"
#include <algorithm>
#include <iostream>

namespace pixels {

ScanSession::ScanSession(Transport& transport)
    : transport_(transport), bluetooth_state_(transport.state()) {}

void ScanSession::add_listener(const ScanCallbacks* listener) {
    notifier_.add_listener(listener);
}

void ScanSession::remove_listener(const ScanCallbacks* listener) {
    notifier_.remove_listener(listener);
}

void ScanSession::start(bool keep_previous, bool allow_duplicates) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!keep_previous) {
            scanned_pixels_.clear();
        }

        scan_requested_ = true;
        transport_.begin_discovery(packets::PIXELS_SERVICE_UUID, allow_duplicates);
        set_scanning(transport_.is_scanning());
    }
    notifier_.dispatch();
}

void ScanSession::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scan_requested_ = false;
        transport_.end_discovery();
        set_scanning(false);
    }
    notifier_.dispatch();
}

void ScanSession::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    scanned_pixels_.clear();
}

BluetoothState ScanSession::bluetooth_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bluetooth_state_;
}

bool ScanSession::is_bluetooth_on() const {
    return pixels::is_bluetooth_on(bluetooth_state());
}

bool ScanSession::is_scanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanning_;
}

std::vector<ScannedPixel> ScanSession::scanned_pixels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanned_pixels_;
}

std::optional<ScannedPixel> ScanSession::find(uint32_t pixel_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(scanned_pixels_.begin(), scanned_pixels_.end(),
                           [pixel_id](const ScannedPixel& s) { return s.pixel_id == pixel_id; });
    if (it == scanned_pixels_.end()) return std::nullopt;
    return *it;
}

std::shared_ptr<Pixel> ScanSession::get_pixel(const ScannedPixel& scanned) {
    return registry_.get_or_create(scanned);
}

void ScanSession::handle_state_changed(BluetoothState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bluetooth_state_ = state;
        notifier_.post_bluetooth_state(state);

        // The radio may be discovering for someone else
        set_scanning(scan_requested_ && transport_.is_scanning());
    }
    notifier_.dispatch();
}

void ScanSession::handle_advertisement(const RawAdvertisement& advertisement) {
    DecodeError error = DecodeError::None;
    auto scanned = parse::interpret(advertisement, &error);
    if (!scanned) {
        std::cerr << "scanner: ignoring advertisement from " << advertisement.peripheral.path
                  << ": " << to_string(error) << std::endl;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Stale event from a scan that has been stopped
        if (!scanning_) return;

        auto it = std::find_if(scanned_pixels_.begin(), scanned_pixels_.end(),
                               [&](const ScannedPixel& s) { return s.pixel_id == scanned->pixel_id; });
        if (it != scanned_pixels_.end()) {
            // Update known die in place
            *it = *scanned;
            notifier_.post_updated(*scanned);
        } else {
            scanned_pixels_.push_back(*scanned);
            notifier_.post_discovered(*scanned);
            notifier_.post_updated(*scanned);
        }
    }
    notifier_.dispatch();
}

// Caller holds mutex_
void ScanSession::set_scanning(bool is_scanning) {
    if (scanning_ != is_scanning) {
        scanning_ = is_scanning;
        notifier_.post_scanning_state(is_scanning);
    }
}

} // namespace pixels
