#pragma once

#include "../types/bluetooth_state.hpp"
#include <string>

namespace pixels {

// BLE central used by the scanner
// Commands are requests: their effect is observed later through the
// state reported by state() and is_scanning()
class Transport {
public:
    virtual ~Transport() = default;

    virtual BluetoothState state() const = 0;
    virtual bool is_scanning() const = 0;

    // Discover peripherals advertising service_uuid
    virtual void begin_discovery(const std::string& service_uuid, bool allow_duplicates) = 0;
    virtual void end_discovery() = 0;
};

} // namespace pixels
