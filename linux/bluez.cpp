#include "bluez.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <exception>
#include <iostream>

namespace bluez {

using pixels::BluetoothState;

static const char* OBJECT_MANAGER_INTERFACE = "org.freedesktop.DBus.ObjectManager";
static const char* PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";

static const char* MATCH_INTERFACES_ADDED =
    "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager',member='InterfacesAdded'";
static const char* MATCH_INTERFACES_REMOVED =
    "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager',member='InterfacesRemoved'";
static const char* MATCH_PROPERTIES_CHANGED =
    "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged'";
static const char* MATCH_NAME_OWNER_CHANGED =
    "type='signal',sender='org.freedesktop.DBus',interface='org.freedesktop.DBus',member='NameOwnerChanged',arg0='org.bluez'";

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "Already" errors are OK (already discovering, no discovery to stop, etc)
static bool is_benign_error(const char* name, const char* message) {
    if (name && strcmp(name, "org.bluez.Error.InProgress") == 0) return true;
    if (!message) return false;
    return strstr(message, "Already") || strstr(message, "already") ||
           strstr(message, "No discovery started");
}

// Reply handler for fire-and-forget method calls
static void on_call_reply(DBusPendingCall* pending, void* data) {
    const char* method = static_cast<const char*>(data);
    DBusMessage* reply = dbus_pending_call_steal_reply(pending);

    if (reply && dbus_message_get_type(reply) == DBUS_MESSAGE_TYPE_ERROR) {
        DBusError err;
        dbus_error_init(&err);
        dbus_set_error_from_message(&err, reply);
        if (!is_benign_error(err.name, err.message)) {
            std::cerr << "bluez: " << method << " failed: " << err.message << std::endl;
        }
        dbus_error_free(&err);
    }

    if (reply) dbus_message_unref(reply);
    dbus_pending_call_unref(pending);
}

// Send a method call without waiting for its reply, errors are logged
// Takes ownership of msg
static bool send_async(DBusConnection* conn, DBusMessage* msg, const char* method) {
    DBusPendingCall* pending = nullptr;
    bool sent = dbus_connection_send_with_reply(conn, msg, &pending, CALL_TIMEOUT_MS);
    dbus_message_unref(msg);

    if (!sent || !pending) {
        std::cerr << "bluez: " << method << " failed: unable to send" << std::endl;
        return false;
    }

    if (!dbus_pending_call_set_notify(pending, on_call_reply, const_cast<char*>(method), nullptr)) {
        std::cerr << "bluez: " << method << " failed: out of memory" << std::endl;
        dbus_pending_call_cancel(pending);
        dbus_pending_call_unref(pending);
        return false;
    }

    dbus_connection_flush(conn);
    return true;
}

// Helper to append {sv} dict entries
static void append_entry_string(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_entry_bool(DBusMessageIter* dict, const char* key, bool value) {
    DBusMessageIter entry, variant;
    dbus_bool_t val = value ? TRUE : FALSE;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_entry_string_array(DBusMessageIter* dict, const char* key,
                                      const std::vector<std::string>& values) {
    DBusMessageIter entry, variant, array;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
    for (const auto& value : values) {
        const char* str = value.c_str();
        dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &str);
    }
    dbus_message_iter_close_container(&variant, &array);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static bool read_bool(DBusMessageIter* variant, bool* out) {
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_BOOLEAN) return false;
    dbus_bool_t val;
    dbus_message_iter_get_basic(variant, &val);
    *out = val;
    return true;
}

static std::optional<std::string> read_string(DBusMessageIter* variant) {
    int type = dbus_message_iter_get_arg_type(variant);
    if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) return std::nullopt;
    const char* val;
    dbus_message_iter_get_basic(variant, &val);
    return std::string(val);
}

// Read ay
static std::vector<uint8_t> read_bytes(DBusMessageIter* array_iter) {
    std::vector<uint8_t> bytes;
    if (dbus_message_iter_get_arg_type(array_iter) != DBUS_TYPE_ARRAY) return bytes;

    DBusMessageIter it;
    dbus_message_iter_recurse(array_iter, &it);
    while (dbus_message_iter_get_arg_type(&it) == DBUS_TYPE_BYTE) {
        uint8_t byte;
        dbus_message_iter_get_basic(&it, &byte);
        bytes.push_back(byte);
        dbus_message_iter_next(&it);
    }
    return bytes;
}

// Read as
static std::vector<std::string> read_string_array(DBusMessageIter* array_iter) {
    std::vector<std::string> result;
    if (dbus_message_iter_get_arg_type(array_iter) != DBUS_TYPE_ARRAY) return result;

    DBusMessageIter it;
    dbus_message_iter_recurse(array_iter, &it);
    while (dbus_message_iter_get_arg_type(&it) == DBUS_TYPE_STRING) {
        const char* str;
        dbus_message_iter_get_basic(&it, &str);
        result.push_back(str);
        dbus_message_iter_next(&it);
    }
    return result;
}

// ManufacturerData is a{qv} - dict of company id -> variant(array of bytes)
// BlueZ strips the company id from the payload, put it back in front (LE)
static std::optional<std::vector<uint8_t>> read_manufacturer_data(DBusMessageIter* variant) {
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_ARRAY) {
        return std::nullopt;
    }

    DBusMessageIter dict;
    dbus_message_iter_recurse(variant, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_UINT16) {
            uint16_t company_id;
            dbus_message_iter_get_basic(&entry, &company_id);
            dbus_message_iter_next(&entry);

            if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
                DBusMessageIter value;
                dbus_message_iter_recurse(&entry, &value);

                std::vector<uint8_t> data = {
                    static_cast<uint8_t>(company_id & 0xFF),
                    static_cast<uint8_t>(company_id >> 8),
                };
                auto payload = read_bytes(&value);
                data.insert(data.end(), payload.begin(), payload.end());
                return data;
            }
        }
        dbus_message_iter_next(&dict);
    }
    return std::nullopt;
}

// ServiceData is a{sv} - dict of service UUID -> variant(array of bytes)
static std::map<std::string, std::vector<uint8_t>> read_service_data(DBusMessageIter* variant) {
    std::map<std::string, std::vector<uint8_t>> result;
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_ARRAY) {
        return result;
    }

    DBusMessageIter dict;
    dbus_message_iter_recurse(variant, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_STRING) {
            const char* uuid;
            dbus_message_iter_get_basic(&entry, &uuid);
            dbus_message_iter_next(&entry);

            if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
                DBusMessageIter value;
                dbus_message_iter_recurse(&entry, &value);
                result[to_lower(uuid)] = read_bytes(&value);
            }
        }
        dbus_message_iter_next(&dict);
    }
    return result;
}

Central::Central(DBusConnection* conn) : conn_(conn) {
    if (!conn_) return;

    DBusError err;
    dbus_error_init(&err);

    for (const char* rule : {MATCH_INTERFACES_ADDED, MATCH_INTERFACES_REMOVED,
                             MATCH_PROPERTIES_CHANGED, MATCH_NAME_OWNER_CHANGED}) {
        dbus_bus_add_match(conn_, rule, &err);
        if (dbus_error_is_set(&err)) {
            std::cerr << "bluez: failed to add match " << rule << ": " << err.message << std::endl;
            dbus_error_free(&err);
        }
    }

    filter_installed_ = dbus_connection_add_filter(conn_, filter, this, nullptr);
    if (!filter_installed_) {
        std::cerr << "bluez: failed to install message filter" << std::endl;
    }

    dbus_connection_flush(conn_);
}

Central::~Central() {
    if (conn_ && filter_installed_) {
        dbus_connection_remove_filter(conn_, filter, this);
    }
}

void Central::set_callbacks(const Callbacks* callbacks) {
    callbacks_ = callbacks;
}

BluetoothState Central::state() const {
    return state_.load();
}

bool Central::is_scanning() const {
    return discovering_.load();
}

void Central::set_state(BluetoothState state, bool discovering) {
    BluetoothState old_state = state_.exchange(state);
    bool old_discovering = discovering_.exchange(discovering);

    if (old_state != state) {
        std::cout << "bluez: adapter " << pixels::to_string(state) << std::endl;
    }

    if ((old_state != state || old_discovering != discovering) &&
        callbacks_ && callbacks_->on_state_changed) {
        callbacks_->on_state_changed(state);
    }
}

void Central::refresh() {
    // A restarted or replaced adapter does not keep our discovery session
    discovery_requested_ = false;

    if (!conn_) {
        set_state(BluetoothState::Unknown, false);
        return;
    }

    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, "/",
        OBJECT_MANAGER_INTERFACE, "GetManagedObjects");
    if (!msg) return;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn_, msg, CALL_TIMEOUT_MS, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        BluetoothState state = BluetoothState::Unknown;
        if (dbus_error_has_name(&err, DBUS_ERROR_ACCESS_DENIED)) {
            state = BluetoothState::Unauthorized;
        } else if (dbus_error_has_name(&err, DBUS_ERROR_SERVICE_UNKNOWN) ||
                   dbus_error_has_name(&err, DBUS_ERROR_NAME_HAS_NO_OWNER)) {
            state = BluetoothState::Unsupported;
        }
        dbus_error_free(&err);
        adapter_path_.reset();
        devices_.clear();
        set_state(state, false);
        return;
    }

    adapter_path_.reset();
    devices_.clear();
    powered_ = false;
    adapter_discovering_ = false;

    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry, ifaces;
                dbus_message_iter_recurse(&dict, &entry);

                const char* obj_path;
                dbus_message_iter_get_basic(&entry, &obj_path);
                dbus_message_iter_next(&entry);

                if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
                    dbus_message_iter_recurse(&entry, &ifaces);

                    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                        DBusMessageIter iface_entry, props;
                        dbus_message_iter_recurse(&ifaces, &iface_entry);

                        const char* iface_name;
                        dbus_message_iter_get_basic(&iface_entry, &iface_name);
                        dbus_message_iter_next(&iface_entry);
                        dbus_message_iter_recurse(&iface_entry, &props);

                        if (strcmp(iface_name, ADAPTER_INTERFACE) == 0 && !adapter_path_) {
                            adapter_path_ = obj_path;
                            apply_adapter_properties(&props);
                        } else if (strcmp(iface_name, DEVICE_INTERFACE) == 0) {
                            Device& device = devices_[obj_path];
                            device.advertisement.peripheral.path = obj_path;
                            apply_device_properties(device, &props);
                        }
                        dbus_message_iter_next(&ifaces);
                    }
                }

                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    if (!adapter_path_) {
        std::cerr << "bluez: no adapter found" << std::endl;
        set_state(BluetoothState::Unsupported, false);
        return;
    }

    // Devices of other adapters are not ours
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (it->first.rfind(*adapter_path_ + "/", 0) != 0) {
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }

    update_adapter_state();
}

// Report the adapter state. Discovery counts as ours only while requested:
// Discovering is shared by every BlueZ client.
void Central::update_adapter_state() {
    if (!powered_) {
        discovery_requested_ = false;
    }

    BluetoothState state = powered_ ? BluetoothState::On : BluetoothState::Off;
    set_state(state, discovery_requested_ && powered_ && adapter_discovering_);
}

// Use an adapter announced through InterfacesAdded
void Central::adopt_adapter(const char* path, DBusMessageIter* props) {
    std::cout << "bluez: adapter added at " << path << std::endl;

    adapter_path_ = path;
    devices_.clear();
    powered_ = false;
    adapter_discovering_ = false;
    discovery_requested_ = false;

    apply_adapter_properties(props);
    update_adapter_state();
}

// Reads Powered and Discovering from an a{sv} iterator
// Returns true if either changed
bool Central::apply_adapter_properties(DBusMessageIter* props) {
    bool changed = false;

    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (dbus_message_iter_get_arg_type(&prop_entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&prop_entry, &variant);

            bool value;
            if (strcmp(prop_name, "Powered") == 0) {
                if (read_bool(&variant, &value) && value != powered_) {
                    powered_ = value;
                    changed = true;
                }
            } else if (strcmp(prop_name, "Discovering") == 0) {
                if (read_bool(&variant, &value) && value != adapter_discovering_) {
                    adapter_discovering_ = value;
                    changed = true;
                }
            }
        }
        dbus_message_iter_next(props);
    }

    return changed;
}

// Reads advertisement related properties from an a{sv} iterator
// Returns true if any of them were present
bool Central::apply_device_properties(Device& device, DBusMessageIter* props) {
    bool changed = false;
    auto& adv = device.advertisement;

    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (dbus_message_iter_get_arg_type(&prop_entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&prop_entry, &variant);

            if (strcmp(prop_name, "Address") == 0) {
                if (auto address = read_string(&variant)) adv.peripheral.address = *address;
            } else if (strcmp(prop_name, "Name") == 0) {
                adv.local_name = read_string(&variant);
                changed = true;
            } else if (strcmp(prop_name, "RSSI") == 0) {
                if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_INT16) {
                    dbus_int16_t rssi;
                    dbus_message_iter_get_basic(&variant, &rssi);
                    adv.rssi = rssi;
                    changed = true;
                }
            } else if (strcmp(prop_name, "ManufacturerData") == 0) {
                adv.manufacturer_data = read_manufacturer_data(&variant);
                changed = true;
            } else if (strcmp(prop_name, "ServiceData") == 0) {
                adv.service_data = read_service_data(&variant);
                changed = true;
            } else if (strcmp(prop_name, "UUIDs") == 0) {
                device.uuids.clear();
                for (const auto& uuid : read_string_array(&variant)) {
                    device.uuids.push_back(to_lower(uuid));
                }
            }
        }
        dbus_message_iter_next(props);
    }
    return changed;
}

Central::Device& Central::device_for(const std::string& path) {
    auto it = devices_.find(path);
    if (it != devices_.end()) {
        return it->second;
    }

    Device& device = devices_[path];
    device.advertisement.peripheral.path = path;
    fetch_device(path, device);
    return device;
}

// Fill a device first seen through PropertiesChanged
void Central::fetch_device(const std::string& path, Device& device) {
    if (!conn_) return;

    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, path.c_str(),
        PROPERTIES_INTERFACE, "GetAll");
    if (!msg) return;

    const char* iface = DEVICE_INTERFACE;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn_, msg, CALL_TIMEOUT_MS, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetAll " << path << " failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return;
    }

    if (reply) {
        DBusMessageIter iter, props;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&iter, &props);
            apply_device_properties(device, &props);
        }
        dbus_message_unref(reply);
    }
}

void Central::notify_advertisement(const Device& device) {
    if (!callbacks_ || !callbacks_->on_advertisement) return;

    // Only report devices matching the discovery filter
    if (!service_filter_.empty()) {
        bool match = device.advertisement.service_data.count(service_filter_) > 0 ||
                     std::find(device.uuids.begin(), device.uuids.end(), service_filter_) != device.uuids.end();
        if (!match) return;
    }

    callbacks_->on_advertisement(device.advertisement);
}

void Central::begin_discovery(const std::string& service_uuid, bool allow_duplicates) {
    if (!conn_ || !adapter_path_) {
        std::cerr << "bluez: no adapter found" << std::endl;
        return;
    }

    service_filter_ = to_lower(service_uuid);

    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, adapter_path_->c_str(),
        ADAPTER_INTERFACE, "SetDiscoveryFilter");
    if (!msg) return;

    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    append_entry_string_array(&dict, "UUIDs", {service_filter_});
    append_entry_string(&dict, "Transport", "le");
    append_entry_bool(&dict, "DuplicateData", allow_duplicates);
    dbus_message_iter_close_container(&iter, &dict);

    if (!send_async(conn_, msg, "SetDiscoveryFilter")) return;

    msg = dbus_message_new_method_call(SERVICE_NAME, adapter_path_->c_str(),
        ADAPTER_INTERFACE, "StartDiscovery");
    if (!msg) return;

    if (!send_async(conn_, msg, "StartDiscovery")) return;

    std::cout << "bluez: discovery requested for " << service_filter_
              << (allow_duplicates ? " (duplicates)" : "") << std::endl;

    // No callback from here, the caller reads is_scanning() afterwards
    discovery_requested_ = true;
    discovering_ = powered_ && adapter_discovering_;
}

void Central::end_discovery() {
    discovery_requested_ = false;
    discovering_ = false;

    if (!conn_ || !adapter_path_) return;

    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, adapter_path_->c_str(),
        ADAPTER_INTERFACE, "StopDiscovery");
    if (!msg) return;

    send_async(conn_, msg, "StopDiscovery");
}

void Central::handle_interfaces_added(DBusMessageIter* iter) {
    // First arg: object path
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_OBJECT_PATH) return;
    const char* obj_path;
    dbus_message_iter_get_basic(iter, &obj_path);

    // Second arg: interfaces dict
    dbus_message_iter_next(iter);
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter ifaces;
    dbus_message_iter_recurse(iter, &ifaces);

    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, props;
        dbus_message_iter_recurse(&ifaces, &entry);

        const char* iface_name;
        dbus_message_iter_get_basic(&entry, &iface_name);
        dbus_message_iter_next(&entry);

        if (strcmp(iface_name, ADAPTER_INTERFACE) == 0 && !adapter_path_ &&
            dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&entry, &props);
            adopt_adapter(obj_path, &props);
            return;
        }

        if (strcmp(iface_name, DEVICE_INTERFACE) == 0 && adapter_path_ &&
            std::string(obj_path).rfind(*adapter_path_ + "/", 0) == 0 &&
            dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&entry, &props);

            Device& device = devices_[obj_path];
            device.advertisement.peripheral.path = obj_path;
            if (apply_device_properties(device, &props)) {
                notify_advertisement(device);
            }
        }
        dbus_message_iter_next(&ifaces);
    }
}

void Central::handle_interfaces_removed(DBusMessageIter* iter) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_OBJECT_PATH) return;
    const char* obj_path;
    dbus_message_iter_get_basic(iter, &obj_path);

    dbus_message_iter_next(iter);
    for (const auto& iface : read_string_array(iter)) {
        if (iface == ADAPTER_INTERFACE && adapter_path_ && *adapter_path_ == obj_path) {
            std::cout << "bluez: adapter removed" << std::endl;
            refresh();
            return;
        }
        if (iface == DEVICE_INTERFACE) {
            devices_.erase(obj_path);
        }
    }
}

void Central::handle_properties_changed(const char* path, DBusMessageIter* iter) {
    // First arg: interface name
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_STRING) return;
    const char* changed_iface;
    dbus_message_iter_get_basic(iter, &changed_iface);

    // Second arg: changed properties dict
    dbus_message_iter_next(iter);
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter props;
    dbus_message_iter_recurse(iter, &props);

    if (strcmp(changed_iface, ADAPTER_INTERFACE) == 0) {
        if (!adapter_path_ || *adapter_path_ != path) return;

        if (apply_adapter_properties(&props)) {
            update_adapter_state();
        }
        return;
    }

    if (strcmp(changed_iface, DEVICE_INTERFACE) == 0) {
        if (!adapter_path_ || std::string(path).rfind(*adapter_path_ + "/", 0) != 0) return;

        Device& device = device_for(path);
        if (apply_device_properties(device, &props)) {
            notify_advertisement(device);
        }
    }
}

bool Central::handle_signal(DBusMessage* msg) {
    try {
        return dispatch_signal(msg);
    } catch (const std::exception& e) {
        std::cerr << "bluez: event handler failed: " << e.what() << std::endl;
        return true;
    }
}

bool Central::dispatch_signal(DBusMessage* msg) {
    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    if (!iface || !member) return false;

    // bluetoothd (re)started or exited
    if (strcmp(iface, "org.freedesktop.DBus") == 0 &&
        strcmp(member, "NameOwnerChanged") == 0) {
        const char* name = nullptr;
        const char* old_owner = nullptr;
        const char* new_owner = nullptr;
        if (dbus_message_get_args(msg, nullptr,
                DBUS_TYPE_STRING, &name,
                DBUS_TYPE_STRING, &old_owner,
                DBUS_TYPE_STRING, &new_owner,
                DBUS_TYPE_INVALID) && strcmp(name, SERVICE_NAME) == 0) {
            std::cout << "bluez: service " << (*new_owner ? "started" : "stopped") << std::endl;
            refresh();
            return true;
        }
        return false;
    }

    DBusMessageIter iter;

    if (strcmp(iface, OBJECT_MANAGER_INTERFACE) == 0 && strcmp(member, "InterfacesAdded") == 0) {
        if (dbus_message_iter_init(msg, &iter)) handle_interfaces_added(&iter);
        return true;
    }

    if (strcmp(iface, OBJECT_MANAGER_INTERFACE) == 0 && strcmp(member, "InterfacesRemoved") == 0) {
        if (dbus_message_iter_init(msg, &iter)) handle_interfaces_removed(&iter);
        return true;
    }

    if (strcmp(iface, PROPERTIES_INTERFACE) == 0 && strcmp(member, "PropertiesChanged") == 0) {
        const char* obj_path = dbus_message_get_path(msg);
        if (!obj_path) return false;
        if (dbus_message_iter_init(msg, &iter)) handle_properties_changed(obj_path, &iter);
        return true;
    }

    return false;
}

DBusHandlerResult Central::filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    auto* central = static_cast<Central*>(data);

    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL) {
        if (central->handle_signal(msg)) {
            return DBUS_HANDLER_RESULT_HANDLED;
        }
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void Central::process_pending() {
    if (!conn_) return;
    dbus_connection_read_write(conn_, 0);
    while (dbus_connection_dispatch(conn_) == DBUS_DISPATCH_DATA_REMAINS) {}
}

int Central::get_fd() const {
    int fd = -1;
    if (conn_ && dbus_connection_get_unix_fd(conn_, &fd)) {
        return fd;
    }
    return -1;
}

} // namespace bluez
