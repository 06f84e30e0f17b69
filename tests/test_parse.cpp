#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <protocol/packets.hpp>
#include <protocol/parse.hpp>
#include <types/battery.hpp>
#include <types/enums.hpp>

#include <chrono>

using namespace pixels;
using pixels::test::AdvertisementFields;
using pixels::test::make_advertisement;

TEST_CASE("Battery byte unpacking", "[parse]") {
    auto charging = unpack_battery(0x96);
    REQUIRE(charging.level == 22);
    REQUIRE(charging.charging);

    auto discharging = unpack_battery(0x50);
    REQUIRE(discharging.level == 80);
    REQUIRE_FALSE(discharging.charging);
}

TEST_CASE("Records decode to the values they were encoded from", "[parse]") {
    parse::ManufacturerData manuf;
    manuf.company_id = 0x0A0B;
    manuf.led_count = 6;
    manuf.design_and_color = 0x26;
    manuf.roll_state = 3;
    manuf.face_index = 4;
    manuf.battery = 0xE3;

    auto manuf_bytes = parse::encode_manufacturer_data(manuf);
    REQUIRE(manuf_bytes.size() == 7);
    CHECK(manuf_bytes[0] == 0x0B);
    CHECK(manuf_bytes[1] == 0x0A);

    DecodeError error = DecodeError::TruncatedBuffer;
    auto decoded_manuf = parse::parse_manufacturer_data(manuf_bytes, &error);
    REQUIRE(decoded_manuf);
    CHECK(error == DecodeError::None);
    CHECK(*decoded_manuf == manuf);

    parse::ServiceData serv;
    serv.pixel_id = 0x89ABCDEF;
    serv.firmware_date = 1700000000;

    auto decoded_serv = parse::parse_service_data(parse::encode_service_data(serv));
    REQUIRE(decoded_serv);
    CHECK(*decoded_serv == serv);

    // Any changed field shows up in the comparison
    parse::ManufacturerData other = manuf;
    other.company_id = 0xFFFF;
    CHECK_FALSE(*decoded_manuf == other);
}

TEST_CASE("Interpret a complete advertisement", "[parse]") {
    AdvertisementFields fields;
    fields.pixel_id = 0xCAFE0042;
    fields.name = "Red d20";
    fields.rssi = -48;
    fields.led_count = 20;
    fields.design_and_color = 0x71;
    fields.roll_state = 5;
    fields.face_index = 19;
    fields.battery = 0x96;
    fields.firmware_date = 1680000000;

    auto adv = make_advertisement(fields);
    DecodeError error = DecodeError::None;
    auto pixel = parse::interpret(adv, &error);

    REQUIRE(pixel);
    REQUIRE(error == DecodeError::None);
    CHECK(pixel->pixel_id == 0xCAFE0042);
    CHECK(pixel->name == "Red d20");
    CHECK(pixel->rssi == -48);
    CHECK(pixel->led_count == 20);
    CHECK(pixel->colorway == Colorway::OnyxBlack);
    CHECK(pixel->die_type == DieType::D20);
    CHECK(pixel->roll_state == RollState::OnFace);
    CHECK(pixel->current_face == 20);
    CHECK(pixel->battery_level == 22);
    CHECK(pixel->is_charging);
    CHECK(pixel->firmware_date ==
          std::chrono::system_clock::time_point(std::chrono::seconds(1680000000)));
    CHECK(pixel->peripheral == adv.peripheral);
}

TEST_CASE("Design byte splits into colorway and die type", "[parse]") {
    AdvertisementFields fields;

    SECTION("low nibble colorway, high nibble die type") {
        fields.design_and_color = 0x21;
        auto pixel = parse::interpret(make_advertisement(fields));
        REQUIRE(pixel);
        CHECK(pixel->colorway == Colorway::OnyxBlack);
        CHECK(pixel->die_type == DieType::D6);
    }

    SECTION("unknown values decode instead of failing") {
        fields.design_and_color = 0xFF;
        auto pixel = parse::interpret(make_advertisement(fields));
        REQUIRE(pixel);
        CHECK(pixel->colorway == Colorway::Unknown);
        CHECK(pixel->die_type == DieType::Unknown);
    }
}

TEST_CASE("Out of range roll state maps to unknown", "[parse]") {
    AdvertisementFields fields;
    fields.roll_state = 42;
    auto pixel = parse::interpret(make_advertisement(fields));
    REQUIRE(pixel);
    CHECK(pixel->roll_state == RollState::Unknown);
}

TEST_CASE("Face index is reported one-based", "[parse]") {
    AdvertisementFields fields;
    fields.face_index = 0;
    auto pixel = parse::interpret(make_advertisement(fields));
    REQUIRE(pixel);
    CHECK(pixel->current_face == 1);
}

TEST_CASE("Missing name and signal strength use defaults", "[parse]") {
    auto adv = make_advertisement(0x01020304);
    adv.local_name.reset();
    adv.rssi.reset();

    auto pixel = parse::interpret(adv);
    REQUIRE(pixel);
    CHECK(pixel->name.empty());
    CHECK(pixel->rssi == 0);
}

TEST_CASE("Advertisements without Pixels payloads are rejected", "[parse]") {
    auto adv = make_advertisement(0x01020304);
    DecodeError error = DecodeError::None;

    SECTION("no manufacturer data") {
        adv.manufacturer_data.reset();
        REQUIRE_FALSE(parse::interpret(adv, &error));
        CHECK(error == DecodeError::MissingAdvertisementFields);
    }

    SECTION("no service data") {
        adv.service_data.clear();
        REQUIRE_FALSE(parse::interpret(adv, &error));
        CHECK(error == DecodeError::MissingAdvertisementFields);
    }

    SECTION("short manufacturer data") {
        adv.manufacturer_data->resize(6);
        REQUIRE_FALSE(parse::interpret(adv, &error));
        CHECK(error == DecodeError::TruncatedBuffer);
    }

    SECTION("short service data") {
        adv.service_data[packets::PIXELS_SERVICE_UUID].resize(7);
        REQUIRE_FALSE(parse::interpret(adv, &error));
        CHECK(error == DecodeError::TruncatedBuffer);
    }
}

TEST_CASE("Service data selection", "[parse]") {
    parse::ServiceData ours;
    ours.pixel_id = 0xAAAAAAAA;
    parse::ServiceData other;
    other.pixel_id = 0xBBBBBBBB;

    auto adv = make_advertisement(0);
    adv.service_data.clear();

    SECTION("falls back to the first entry") {
        adv.service_data["0000180f-0000-1000-8000-00805f9b34fb"] = parse::encode_service_data(other);
        auto pixel = parse::interpret(adv);
        REQUIRE(pixel);
        CHECK(pixel->pixel_id == 0xBBBBBBBB);
    }

    SECTION("prefers the Pixels service") {
        adv.service_data["0000180f-0000-1000-8000-00805f9b34fb"] = parse::encode_service_data(other);
        adv.service_data[packets::PIXELS_SERVICE_UUID] = parse::encode_service_data(ours);
        auto pixel = parse::interpret(adv);
        REQUIRE(pixel);
        CHECK(pixel->pixel_id == 0xAAAAAAAA);
    }
}

TEST_CASE("Decode a raw payload", "[parse]") {
    // d6 white aurora on face 3, 64% battery
    RawAdvertisement adv;
    adv.manufacturer_data = packets::parse_hex("ffff0626050240");
    adv.service_data[packets::PIXELS_SERVICE_UUID] = *packets::parse_hex("785634120000000000");

    auto pixel = parse::interpret(adv);
    REQUIRE(pixel);
    CHECK(pixel->pixel_id == 0x12345678);
    CHECK(pixel->led_count == 6);
    CHECK(pixel->colorway == Colorway::WhiteAurora);
    CHECK(pixel->die_type == DieType::D6);
    CHECK(pixel->roll_state == RollState::OnFace);
    CHECK(pixel->current_face == 3);
    CHECK(pixel->battery_level == 64);
    CHECK_FALSE(pixel->is_charging);
    CHECK(face_count(pixel->die_type) == 6);
}
