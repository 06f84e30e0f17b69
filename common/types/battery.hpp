#pragma once

#include <cstdint>

namespace pixels {

// Battery byte layout: bit 7 = charging, bits 0-6 = level 0-100
constexpr uint8_t battery_level_mask = 0x7F;
constexpr uint8_t battery_charging_mask = 0x80;

struct BatteryLevel {
    int level = 0;  // 0-100
    bool charging = false;
};

inline BatteryLevel unpack_battery(uint8_t byte) {
    BatteryLevel battery;
    battery.level = byte & battery_level_mask;
    battery.charging = (byte & battery_charging_mask) != 0;
    return battery;
}

} // namespace pixels
