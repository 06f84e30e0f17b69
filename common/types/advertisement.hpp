#pragma once

#include "device.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pixels {

// One advertisement as reported by the transport
struct RawAdvertisement {
    PeripheralHandle peripheral;

    // Starts with the 2-byte little-endian company id
    std::optional<std::vector<uint8_t>> manufacturer_data;

    // Service UUID (lowercase) -> service data
    std::map<std::string, std::vector<uint8_t>> service_data;

    std::optional<std::string> local_name;
    std::optional<int> rssi;  // dBm
};

} // namespace pixels
