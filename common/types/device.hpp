#pragma once

#include "enums.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace pixels {

// Transport reference to the radio peripheral, needed to connect later
struct PeripheralHandle {
    std::string path;     // BlueZ object path
    std::string address;  // MAC address

    bool operator==(const PeripheralHandle&) const = default;
};

// Snapshot of a die built from one advertisement
struct ScannedPixel {
    PeripheralHandle peripheral;

    // Identity
    uint32_t pixel_id = 0;
    std::string name;
    int led_count = 0;
    Colorway colorway = Colorway::Unknown;
    DieType die_type = DieType::Unknown;
    std::chrono::system_clock::time_point firmware_date{};

    // State
    int rssi = 0;
    int battery_level = 0;  // 0-100
    bool is_charging = false;
    RollState roll_state = RollState::Unknown;
    int current_face = 0;  // 1-based

    bool operator==(const ScannedPixel&) const = default;
};

inline std::string format_pixel_id(uint32_t pixel_id) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08X", pixel_id);
    return buf;
}

inline std::string to_string(const ScannedPixel& pixel) {
    std::time_t fw = std::chrono::system_clock::to_time_t(pixel.firmware_date);
    std::tm tm{};
    gmtime_r(&fw, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);

    std::ostringstream out;
    out << format_pixel_id(pixel.pixel_id)
        << " \"" << pixel.name << "\""
        << " " << to_string(pixel.die_type)
        << " " << to_string(pixel.colorway)
        << " leds=" << pixel.led_count
        << " face=" << pixel.current_face;
    if (int faces = face_count(pixel.die_type)) {
        out << "/" << faces;
    }
    out << " roll=" << to_string(pixel.roll_state)
        << " battery=" << pixel.battery_level << "%" << (pixel.is_charging ? "+" : "")
        << " rssi=" << pixel.rssi
        << " fw=" << date
        << " addr=" << pixel.peripheral.address;
    return out.str();
}

} // namespace pixels
