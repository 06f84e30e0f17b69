#include "layout.hpp"

namespace pixels {

std::string_view to_string(DecodeError error) {
    switch (error) {
        case DecodeError::None: return "none";
        case DecodeError::TruncatedBuffer: return "truncated buffer";
        case DecodeError::MissingAdvertisementFields: return "missing advertisement fields";
    }
    return "unknown";
}

} // namespace pixels

namespace pixels::layout {

std::optional<uint32_t> Record::get(std::string_view name) const {
    for (size_t i = 0; i < fields.size() && i < values.size(); ++i) {
        if (fields[i].name == name) return values[i];
    }
    return std::nullopt;
}

std::optional<Record> decode(std::span<const Field> fields,
                             std::span<const uint8_t> data,
                             DecodeError* error) {
    if (error) *error = DecodeError::None;

    if (data.size() < total_width(fields)) {
        if (error) *error = DecodeError::TruncatedBuffer;
        return std::nullopt;
    }

    Record record;
    record.fields.assign(fields.begin(), fields.end());
    record.values.reserve(fields.size());

    size_t offset = 0;
    for (const auto& field : fields) {
        uint32_t value = 0;
        for (size_t i = 0; i < field.width; ++i) {
            value |= static_cast<uint32_t>(data[offset + i]) << (8 * i);
        }
        record.values.push_back(value);
        offset += field.width;
    }

    return record;
}

std::vector<uint8_t> encode(std::span<const Field> fields,
                            std::span<const uint32_t> values) {
    std::vector<uint8_t> data;
    data.reserve(total_width(fields));

    for (size_t i = 0; i < fields.size(); ++i) {
        uint32_t value = i < values.size() ? values[i] : 0;
        for (size_t b = 0; b < fields[i].width; ++b) {
            data.push_back(static_cast<uint8_t>((value >> (8 * b)) & 0xFF));
        }
    }

    return data;
}

} // namespace pixels::layout
