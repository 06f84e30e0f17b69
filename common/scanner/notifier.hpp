#pragma once

#include "../types/bluetooth_state.hpp"
#include "../types/device.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace pixels {

// Scanner events, unset members are skipped
struct ScanCallbacks {
    std::function<void(BluetoothState)> on_bluetooth_state_changed;
    std::function<void(bool is_scanning)> on_scanning_state_changed;

    // A new die, on_pixel_updated follows for the same snapshot
    std::function<void(const ScannedPixel&)> on_pixel_discovered;

    // A new die or new information about a known one
    std::function<void(const ScannedPixel&)> on_pixel_updated;
};

// Queues events and delivers them to listeners in posting order.
// Listeners are not owned: remove them before they are destroyed.
class Notifier {
public:
    void add_listener(const ScanCallbacks* listener);
    void remove_listener(const ScanCallbacks* listener);

    void post_bluetooth_state(BluetoothState state);
    void post_scanning_state(bool is_scanning);
    void post_discovered(const ScannedPixel& pixel);
    void post_updated(const ScannedPixel& pixel);

    // Deliver queued events. If another call is already delivering (on any
    // thread, including from inside a callback) this returns immediately and
    // the queued events are delivered by that call.
    void dispatch();

private:
    enum class EventType {
        BluetoothState,
        ScanningState,
        Discovered,
        Updated,
    };

    struct Event {
        EventType type = EventType::BluetoothState;
        BluetoothState state = BluetoothState::Unknown;
        bool is_scanning = false;
        ScannedPixel pixel{};
    };

    void post(Event event);
    void deliver(const Event& event);

    std::mutex queue_mutex_;
    std::deque<Event> queue_;
    bool dispatching_ = false;

    // Held while delivering, recursive so callbacks may remove listeners
    std::recursive_mutex listeners_mutex_;
    std::vector<const ScanCallbacks*> listeners_;
};

} // namespace pixels
