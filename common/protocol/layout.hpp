#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace pixels {

enum class DecodeError {
    None,
    TruncatedBuffer,             // buffer shorter than the layout
    MissingAdvertisementFields,  // manufacturer or service data absent
};

std::string_view to_string(DecodeError error);

} // namespace pixels

// Fixed-width little-endian records: fields are read in order, no padding
namespace pixels::layout {

struct Field {
    std::string_view name;
    uint8_t width;  // 1, 2 or 4 bytes
};

constexpr size_t total_width(std::span<const Field> fields) {
    size_t width = 0;
    for (const auto& field : fields) {
        width += field.width;
    }
    return width;
}

constexpr bool is_valid(std::span<const Field> fields) {
    if (fields.empty()) return false;
    for (const auto& field : fields) {
        if (field.width != 1 && field.width != 2 && field.width != 4) return false;
    }
    return true;
}

// Decoded values, one per field, in layout order
// Fields are copied, their names must outlive the record
struct Record {
    std::vector<Field> fields;
    std::vector<uint32_t> values;

    std::optional<uint32_t> get(std::string_view name) const;
};

// Decode a record from the start of data
// Returns nullopt (TruncatedBuffer) if data is shorter than the layout,
// trailing bytes are ignored
std::optional<Record> decode(std::span<const Field> fields,
                             std::span<const uint8_t> data,
                             DecodeError* error = nullptr);

// Encode values in layout order, each truncated to its field width
// Missing values are written as zero
std::vector<uint8_t> encode(std::span<const Field> fields,
                            std::span<const uint32_t> values);

} // namespace pixels::layout
