#pragma once

#include "../types/advertisement.hpp"
#include "../types/device.hpp"
#include "layout.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pixels::parse {

struct ManufacturerData {
    uint16_t company_id = 0;
    uint8_t led_count = 0;
    uint8_t design_and_color = 0;  // low nibble colorway, high nibble die type
    uint8_t roll_state = 0;
    uint8_t face_index = 0;        // 0-based
    uint8_t battery = 0;           // bit 7 charging, bits 0-6 level

    bool operator==(const ManufacturerData&) const = default;
};

struct ServiceData {
    uint32_t pixel_id = 0;
    uint32_t firmware_date = 0;  // seconds since epoch

    bool operator==(const ServiceData&) const = default;
};

// Parse manufacturer data (company id included)
// Returns nullopt if data is too short
std::optional<ManufacturerData> parse_manufacturer_data(std::span<const uint8_t> data,
                                                        DecodeError* error = nullptr);

// Parse service data
std::optional<ServiceData> parse_service_data(std::span<const uint8_t> data,
                                              DecodeError* error = nullptr);

// Pick the Pixels service data entry, or the first entry if the Pixels
// service UUID is not a key. Returns nullptr if there is no service data.
const std::vector<uint8_t>* select_service_data(const RawAdvertisement& advertisement);

// Build a snapshot from an advertisement
// Returns nullopt with MissingAdvertisementFields if manufacturer or service data
// is absent, or TruncatedBuffer if either is too short
std::optional<ScannedPixel> interpret(const RawAdvertisement& advertisement,
                                      DecodeError* error = nullptr);

// Encoders for the two records, inverse of the parsers above
std::vector<uint8_t> encode_manufacturer_data(const ManufacturerData& data);
std::vector<uint8_t> encode_service_data(const ServiceData& data);

} // namespace pixels::parse
