#include <catch2/catch.hpp>

#include <bluez.hpp>

#include <protocol/packets.hpp>
#include <protocol/parse.hpp>

#include <dbus/dbus.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using pixels::BluetoothState;

namespace {

constexpr const char* ADAPTER_PATH = "/org/bluez/hci0";
constexpr const char* DEVICE_PATH = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";

void append_bool(DBusMessageIter* dict, const char* key, bool value) {
    DBusMessageIter entry, variant;
    dbus_bool_t val = value ? TRUE : FALSE;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

void append_string(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

void append_rssi(DBusMessageIter* dict, dbus_int16_t rssi) {
    const char* key = "RSSI";
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "n", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT16, &rssi);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

void append_byte_variant(DBusMessageIter* entry, const std::vector<uint8_t>& bytes) {
    DBusMessageIter variant, array;
    const uint8_t* data = bytes.data();
    dbus_message_iter_open_container(entry, DBUS_TYPE_VARIANT, "ay", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "y", &array);
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data,
                                         static_cast<int>(bytes.size()));
    dbus_message_iter_close_container(&variant, &array);
    dbus_message_iter_close_container(entry, &variant);
}

// ManufacturerData a{qv}, payload without the company id as BlueZ reports it
void append_manufacturer_data(DBusMessageIter* dict, uint16_t company_id,
                              const std::vector<uint8_t>& payload) {
    const char* key = "ManufacturerData";
    DBusMessageIter entry, variant, map, map_entry;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "a{qv}", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "{qv}", &map);
    dbus_message_iter_open_container(&map, DBUS_TYPE_DICT_ENTRY, nullptr, &map_entry);
    dbus_message_iter_append_basic(&map_entry, DBUS_TYPE_UINT16, &company_id);
    append_byte_variant(&map_entry, payload);
    dbus_message_iter_close_container(&map, &map_entry);
    dbus_message_iter_close_container(&variant, &map);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

// ServiceData a{sv}
void append_service_data(DBusMessageIter* dict, const char* uuid,
                         const std::vector<uint8_t>& payload) {
    const char* key = "ServiceData";
    DBusMessageIter entry, variant, map, map_entry;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "a{sv}", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "{sv}", &map);
    dbus_message_iter_open_container(&map, DBUS_TYPE_DICT_ENTRY, nullptr, &map_entry);
    dbus_message_iter_append_basic(&map_entry, DBUS_TYPE_STRING, &uuid);
    append_byte_variant(&map_entry, payload);
    dbus_message_iter_close_container(&map, &map_entry);
    dbus_message_iter_close_container(&variant, &map);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

// InterfacesAdded(o path, a{sa{sv}}) with a single interface
template<typename Fill>
DBusMessage* interfaces_added(const char* path, const char* iface, Fill fill) {
    DBusMessage* msg = dbus_message_new_signal("/", "org.freedesktop.DBus.ObjectManager",
                                               "InterfacesAdded");
    DBusMessageIter iter, ifaces, iface_entry, props;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_OBJECT_PATH, &path);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sa{sv}}", &ifaces);
    dbus_message_iter_open_container(&ifaces, DBUS_TYPE_DICT_ENTRY, nullptr, &iface_entry);
    dbus_message_iter_append_basic(&iface_entry, DBUS_TYPE_STRING, &iface);
    dbus_message_iter_open_container(&iface_entry, DBUS_TYPE_ARRAY, "{sv}", &props);
    fill(&props);
    dbus_message_iter_close_container(&iface_entry, &props);
    dbus_message_iter_close_container(&ifaces, &iface_entry);
    dbus_message_iter_close_container(&iter, &ifaces);
    return msg;
}

// PropertiesChanged(s iface, a{sv} changed, as invalidated)
template<typename Fill>
DBusMessage* properties_changed(const char* path, const char* iface, Fill fill) {
    DBusMessage* msg = dbus_message_new_signal(path, "org.freedesktop.DBus.Properties",
                                               "PropertiesChanged");
    DBusMessageIter iter, props, invalidated;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &props);
    fill(&props);
    dbus_message_iter_close_container(&iter, &props);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);
    return msg;
}

bool deliver(bluez::Central& central, DBusMessage* msg) {
    REQUIRE(msg);
    bool handled = central.handle_signal(msg);
    dbus_message_unref(msg);
    return handled;
}

void add_adapter(bluez::Central& central, bool powered, bool discovering) {
    REQUIRE(deliver(central, interfaces_added(ADAPTER_PATH, bluez::ADAPTER_INTERFACE,
        [&](DBusMessageIter* props) {
            append_bool(props, "Powered", powered);
            append_bool(props, "Discovering", discovering);
        })));
}

} // namespace

TEST_CASE("Central without a bus is unknown", "[bluez]") {
    bluez::Central central(nullptr);
    central.refresh();
    CHECK(central.state() == BluetoothState::Unknown);
    CHECK_FALSE(central.is_scanning());
    CHECK(central.get_fd() == -1);
}

TEST_CASE("Adapter power maps to the Bluetooth state", "[bluez]") {
    bluez::Central central(nullptr);
    std::vector<BluetoothState> states;
    bluez::Callbacks callbacks;
    callbacks.on_state_changed = [&](BluetoothState state) { states.push_back(state); };
    central.set_callbacks(&callbacks);

    add_adapter(central, true, false);
    REQUIRE(central.adapter_path() == std::string(ADAPTER_PATH));
    CHECK(central.state() == BluetoothState::On);

    REQUIRE(deliver(central, properties_changed(ADAPTER_PATH, bluez::ADAPTER_INTERFACE,
        [](DBusMessageIter* props) { append_bool(props, "Powered", false); })));
    CHECK(central.state() == BluetoothState::Off);
    CHECK(states == std::vector<BluetoothState>{BluetoothState::On, BluetoothState::Off});

    central.set_callbacks(nullptr);
}

TEST_CASE("Discovery by other clients is not reported as scanning", "[bluez]") {
    bluez::Central central(nullptr);

    // Adapter already discovering when it shows up
    add_adapter(central, true, true);
    CHECK(central.state() == BluetoothState::On);
    CHECK_FALSE(central.is_scanning());

    // Another client stops and starts discovery again
    for (bool discovering : {false, true}) {
        REQUIRE(deliver(central, properties_changed(ADAPTER_PATH, bluez::ADAPTER_INTERFACE,
            [&](DBusMessageIter* props) { append_bool(props, "Discovering", discovering); })));
        CHECK_FALSE(central.is_scanning());
    }

    central.end_discovery();
    CHECK_FALSE(central.is_scanning());
}

TEST_CASE("Device properties become a raw advertisement", "[bluez]") {
    bluez::Central central(nullptr);
    add_adapter(central, true, false);

    std::vector<pixels::RawAdvertisement> advertisements;
    bluez::Callbacks callbacks;
    callbacks.on_advertisement = [&](const pixels::RawAdvertisement& adv) {
        advertisements.push_back(adv);
    };
    central.set_callbacks(&callbacks);

    pixels::parse::ServiceData serv;
    serv.pixel_id = 0x00C0FFEE;
    serv.firmware_date = 1680000000;
    const std::vector<uint8_t> manuf_payload = {0x14, 0x71, 0x05, 0x13, 0xD0};

    REQUIRE(deliver(central, interfaces_added(DEVICE_PATH, bluez::DEVICE_INTERFACE,
        [&](DBusMessageIter* props) {
            append_string(props, "Address", "AA:BB:CC:DD:EE:FF");
            append_string(props, "Name", "Pixel d20");
            append_rssi(props, -57);
            append_manufacturer_data(props, 0x0A0B, manuf_payload);
            append_service_data(props, "A6B90001-7A5A-43F2-A962-350C8EDC9B5B",
                                pixels::parse::encode_service_data(serv));
        })));

    REQUIRE(advertisements.size() == 1);
    const auto& adv = advertisements[0];
    CHECK(adv.peripheral.path == DEVICE_PATH);
    CHECK(adv.peripheral.address == "AA:BB:CC:DD:EE:FF");
    CHECK(adv.local_name == std::string("Pixel d20"));
    CHECK(adv.rssi == -57);
    CHECK(adv.manufacturer_data ==
          std::vector<uint8_t>{0x0B, 0x0A, 0x14, 0x71, 0x05, 0x13, 0xD0});

    // Service UUID keys are lowercased
    auto pixel = pixels::parse::interpret(adv);
    REQUIRE(pixel);
    CHECK(pixel->pixel_id == 0x00C0FFEE);
    CHECK(pixel->current_face == 20);
    CHECK(pixel->battery_level == 80);
    CHECK(pixel->is_charging);

    // A signal strength update reports the device again
    REQUIRE(deliver(central, properties_changed(DEVICE_PATH, bluez::DEVICE_INTERFACE,
        [](DBusMessageIter* props) { append_rssi(props, -80); })));
    REQUIRE(advertisements.size() == 2);
    CHECK(advertisements[1].rssi == -80);
    CHECK(advertisements[1].manufacturer_data == adv.manufacturer_data);

    central.set_callbacks(nullptr);
}

TEST_CASE("Callback exceptions do not escape signal handling", "[bluez]") {
    bluez::Central central(nullptr);
    add_adapter(central, true, false);

    int calls = 0;
    bluez::Callbacks callbacks;
    callbacks.on_advertisement = [&](const pixels::RawAdvertisement&) {
        ++calls;
        throw std::runtime_error("listener failed");
    };
    central.set_callbacks(&callbacks);

    for (dbus_int16_t rssi : {-60, -61}) {
        bool handled = false;
        CHECK_NOTHROW(handled = deliver(central, properties_changed(DEVICE_PATH,
            bluez::DEVICE_INTERFACE, [&](DBusMessageIter* props) { append_rssi(props, rssi); })));
        CHECK(handled);
    }
    CHECK(calls == 2);

    central.set_callbacks(nullptr);
}
