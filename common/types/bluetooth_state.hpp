#pragma once

#include <cstdint>
#include <string_view>

namespace pixels {

// Radio availability as reported by the platform stack
enum class BluetoothState : uint8_t {
    Unknown,
    Unsupported,
    Unauthorized,
    Off,
    On,
};

inline std::string_view to_string(BluetoothState state) {
    switch (state) {
        case BluetoothState::Unknown: return "unknown";
        case BluetoothState::Unsupported: return "unsupported";
        case BluetoothState::Unauthorized: return "unauthorized";
        case BluetoothState::Off: return "off";
        case BluetoothState::On: return "on";
    }
    return "unknown";
}

inline bool is_bluetooth_on(BluetoothState state) { return state == BluetoothState::On; }

} // namespace pixels
