#pragma once

#include "layout.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace pixels::packets {

// Pixels dice advertise this service and carry their service data under it
constexpr const char* PIXELS_SERVICE_UUID = "a6b90001-7a5a-43f2-a962-350c8edc9b5b";

// Helper to create bytes from hex string literal
template<size_t N>
constexpr std::array<uint8_t, (N - 1) / 2> from_hex(const char (&hex)[N]) {
    std::array<uint8_t, (N - 1) / 2> result{};
    for (size_t i = 0; i < result.size(); ++i) {
        auto hex_to_nibble = [](char c) -> uint8_t {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return 0;
        };
        result[i] = (hex_to_nibble(hex[i * 2]) << 4) | hex_to_nibble(hex[i * 2 + 1]);
    }
    return result;
}

// Runtime variant, rejects odd lengths and non-hex characters
inline std::optional<std::vector<uint8_t>> parse_hex(std::string_view hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

// Manufacturer data: company id (2) led count (1) design/color (1)
// roll state (1) face index (1) battery (1)
constexpr std::array<layout::Field, 6> MANUFACTURER_DATA = {{
    {"company_id", 2},
    {"led_count", 1},
    {"design_and_color", 1},
    {"roll_state", 1},
    {"face_index", 1},
    {"battery", 1},
}};

// Service data: pixel id (4) firmware build date in epoch seconds (4)
constexpr std::array<layout::Field, 2> SERVICE_DATA = {{
    {"pixel_id", 4},
    {"firmware_date", 4},
}};

static_assert(layout::is_valid(MANUFACTURER_DATA));
static_assert(layout::is_valid(SERVICE_DATA));
static_assert(layout::total_width(SERVICE_DATA) == 8);

} // namespace pixels::packets
