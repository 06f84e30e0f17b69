#include "parse.hpp"
#include "packets.hpp"
#include "../types/battery.hpp"
#include "../types/enums.hpp"
#include <array>
#include <chrono>

namespace pixels::parse {

std::optional<ManufacturerData> parse_manufacturer_data(std::span<const uint8_t> data,
                                                        DecodeError* error) {
    auto record = layout::decode(packets::MANUFACTURER_DATA, data, error);
    if (!record) {
        return std::nullopt;
    }

    const auto& v = record->values;
    ManufacturerData manuf;
    manuf.company_id = static_cast<uint16_t>(v[0]);
    manuf.led_count = static_cast<uint8_t>(v[1]);
    manuf.design_and_color = static_cast<uint8_t>(v[2]);
    manuf.roll_state = static_cast<uint8_t>(v[3]);
    manuf.face_index = static_cast<uint8_t>(v[4]);
    manuf.battery = static_cast<uint8_t>(v[5]);
    return manuf;
}

std::optional<ServiceData> parse_service_data(std::span<const uint8_t> data,
                                              DecodeError* error) {
    auto record = layout::decode(packets::SERVICE_DATA, data, error);
    if (!record) {
        return std::nullopt;
    }

    ServiceData serv;
    serv.pixel_id = record->values[0];
    serv.firmware_date = record->values[1];
    return serv;
}

const std::vector<uint8_t>* select_service_data(const RawAdvertisement& advertisement) {
    if (advertisement.service_data.empty()) {
        return nullptr;
    }

    auto it = advertisement.service_data.find(packets::PIXELS_SERVICE_UUID);
    if (it == advertisement.service_data.end()) {
        it = advertisement.service_data.begin();
    }
    return &it->second;
}

std::optional<ScannedPixel> interpret(const RawAdvertisement& advertisement,
                                      DecodeError* error) {
    const std::vector<uint8_t>* service_data = select_service_data(advertisement);
    if (!advertisement.manufacturer_data || !service_data) {
        if (error) *error = DecodeError::MissingAdvertisementFields;
        return std::nullopt;
    }

    auto manuf = parse_manufacturer_data(*advertisement.manufacturer_data, error);
    if (!manuf) {
        return std::nullopt;
    }

    auto serv = parse_service_data(*service_data, error);
    if (!serv) {
        return std::nullopt;
    }

    auto battery = unpack_battery(manuf->battery);

    ScannedPixel pixel;
    pixel.peripheral = advertisement.peripheral;
    pixel.pixel_id = serv->pixel_id;
    pixel.name = advertisement.local_name.value_or("");
    pixel.led_count = manuf->led_count;
    pixel.colorway = colorway_from_raw(manuf->design_and_color & 0x0F);
    pixel.die_type = die_type_from_raw((manuf->design_and_color >> 4) & 0x0F);
    pixel.firmware_date = std::chrono::system_clock::time_point(
        std::chrono::seconds(serv->firmware_date));
    pixel.rssi = advertisement.rssi.value_or(0);
    pixel.battery_level = battery.level;
    pixel.is_charging = battery.charging;
    pixel.roll_state = roll_state_from_raw(manuf->roll_state);
    pixel.current_face = manuf->face_index + 1;
    return pixel;
}

std::vector<uint8_t> encode_manufacturer_data(const ManufacturerData& data) {
    const std::array<uint32_t, 6> values = {
        data.company_id,
        data.led_count,
        data.design_and_color,
        data.roll_state,
        data.face_index,
        data.battery,
    };
    return layout::encode(packets::MANUFACTURER_DATA, values);
}

std::vector<uint8_t> encode_service_data(const ServiceData& data) {
    const std::array<uint32_t, 2> values = {data.pixel_id, data.firmware_date};
    return layout::encode(packets::SERVICE_DATA, values);
}

} // namespace pixels::parse
