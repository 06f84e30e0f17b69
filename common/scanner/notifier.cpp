#include "notifier.hpp"
#include <algorithm>
#include <utility>

namespace pixels {

void Notifier::add_listener(const ScanCallbacks* listener) {
    if (!listener) return;

    std::lock_guard<std::recursive_mutex> lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void Notifier::remove_listener(const ScanCallbacks* listener) {
    std::lock_guard<std::recursive_mutex> lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void Notifier::post_bluetooth_state(BluetoothState state) {
    Event event;
    event.type = EventType::BluetoothState;
    event.state = state;
    post(std::move(event));
}

void Notifier::post_scanning_state(bool is_scanning) {
    Event event;
    event.type = EventType::ScanningState;
    event.is_scanning = is_scanning;
    post(std::move(event));
}

void Notifier::post_discovered(const ScannedPixel& pixel) {
    Event event;
    event.type = EventType::Discovered;
    event.pixel = pixel;
    post(std::move(event));
}

void Notifier::post_updated(const ScannedPixel& pixel) {
    Event event;
    event.type = EventType::Updated;
    event.pixel = pixel;
    post(std::move(event));
}

void Notifier::post(Event event) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(event));
}

void Notifier::dispatch() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (dispatching_) return;
        dispatching_ = true;
    }

    try {
        for (;;) {
            Event event;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (queue_.empty()) {
                    dispatching_ = false;
                    return;
                }
                event = std::move(queue_.front());
                queue_.pop_front();
            }
            deliver(event);
        }
    } catch (...) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dispatching_ = false;
        throw;
    }
}

void Notifier::deliver(const Event& event) {
    std::lock_guard<std::recursive_mutex> lock(listeners_mutex_);

    // Copy so callbacks can add or remove listeners
    const auto listeners = listeners_;
    for (const ScanCallbacks* listener : listeners) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
            continue;  // removed by an earlier callback
        }

        switch (event.type) {
            case EventType::BluetoothState:
                if (listener->on_bluetooth_state_changed) {
                    listener->on_bluetooth_state_changed(event.state);
                }
                break;
            case EventType::ScanningState:
                if (listener->on_scanning_state_changed) {
                    listener->on_scanning_state_changed(event.is_scanning);
                }
                break;
            case EventType::Discovered:
                if (listener->on_pixel_discovered) {
                    listener->on_pixel_discovered(event.pixel);
                }
                break;
            case EventType::Updated:
                if (listener->on_pixel_updated) {
                    listener->on_pixel_updated(event.pixel);
                }
                break;
        }
    }
}

} // namespace pixels
