#include "dbus.hpp"
#include <cstring>
#include <iostream>
#include <vector>

namespace dbus_service {

// Global pointers for callbacks (set in init)
static Callbacks* g_callbacks = nullptr;
static State* g_state = nullptr;

// Introspection XML
static const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"org.audioarbiter.Arbiter1\">\n"
    "    <method name=\"ConnectionStateChanged\">\n"
    "      <arg name=\"profile\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"device\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"previous\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"current\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"ActiveDeviceChanged\">\n"
    "      <arg name=\"profile\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"device\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"DeviceAvailable\">\n"
    "      <arg name=\"device\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"AudioModeChanged\">\n"
    "      <arg name=\"mode\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"WiredAudioConnected\"/>\n"
    "    <property name=\"ClassicMediaDevice\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"ClassicCallDevice\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"HearingAidDevice\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"LeAudioMediaDevice\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"LeAudioCallDevice\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"AudioMode\" type=\"s\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

// All properties are read-only strings
struct Property {
    const char* name;
    std::string State::*field;
};

static const Property PROPERTIES[] = {
    {"ClassicMediaDevice", &State::classic_media_device},
    {"ClassicCallDevice", &State::classic_call_device},
    {"HearingAidDevice", &State::hearing_aid_device},
    {"LeAudioMediaDevice", &State::le_audio_media_device},
    {"LeAudioCallDevice", &State::le_audio_call_device},
    {"AudioMode", &State::audio_mode},
};

static const Property* find_property(const char* name) {
    for (const auto& property : PROPERTIES) {
        if (strcmp(property.name, name) == 0) return &property;
    }
    return nullptr;
}

// Helper to append variant with string
static void append_variant_string(DBusMessageIter* iter, const char* value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append a {sv} dict entry
static void append_entry(DBusMessageIter* dict, const Property& property, const State& state) {
    DBusMessageIter entry;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    const char* name = property.name;
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
    append_variant_string(&entry, (state.*property.field).c_str());
    dbus_message_iter_close_container(dict, &entry);
}

static std::optional<arbiter::DeviceId> device_arg(const char* device) {
    if (!device || device[0] == '\0') return std::nullopt;
    return arbiter::DeviceId(device);
}

// Handle Get property
static DBusMessage* handle_get(DBusMessage* msg, const State& state) {
    const char* iface;
    const char* prop;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_STRING, &prop,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    const Property* property = find_property(prop);
    if (!property) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_variant_string(&iter, (state.*property->field).c_str());
    return reply;
}

// Handle GetAll properties
static DBusMessage* handle_get_all(DBusMessage* msg, const State& state) {
    const char* iface;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (const auto& property : PROPERTIES) {
        append_entry(&dict, property, state);
    }

    dbus_message_iter_close_container(&iter, &dict);
    return reply;
}

static DBusMessage* handle_connection_state_changed(DBusMessage* msg, Callbacks* callbacks) {
    const char* profile_str;
    const char* device;
    const char* prev_str;
    const char* next_str;
    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &profile_str,
            DBUS_TYPE_STRING, &device,
            DBUS_TYPE_STRING, &prev_str,
            DBUS_TYPE_STRING, &next_str,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (ssss)");
    }

    auto profile = arbiter::profile_from_string(profile_str);
    auto prev = arbiter::connection_state_from_string(prev_str);
    auto next = arbiter::connection_state_from_string(next_str);
    if (!profile || !prev || !next) {
        std::cerr << "dbus: bad ConnectionStateChanged(" << profile_str << ", " << device
                  << ", " << prev_str << ", " << next_str << ")" << std::endl;
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Unknown profile or state");
    }

    std::cout << "dbus: ConnectionStateChanged(" << profile_str << ", " << device << ", "
              << prev_str << " -> " << next_str << ")" << std::endl;
    if (callbacks && callbacks->on_connection_state_changed) {
        callbacks->on_connection_state_changed(*profile, device_arg(device), *prev, *next);
    }
    return dbus_message_new_method_return(msg);
}

static DBusMessage* handle_active_device_changed(DBusMessage* msg, Callbacks* callbacks) {
    const char* profile_str;
    const char* device;
    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &profile_str,
            DBUS_TYPE_STRING, &device,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (ss)");
    }

    auto profile = arbiter::profile_from_string(profile_str);
    if (!profile) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Unknown profile");
    }

    std::cout << "dbus: ActiveDeviceChanged(" << profile_str << ", " << device << ")" << std::endl;
    if (callbacks && callbacks->on_active_device_changed) {
        callbacks->on_active_device_changed(*profile, device_arg(device));
    }
    return dbus_message_new_method_return(msg);
}

// Message handler
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)data;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    // Introspection
    if (iface && strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 &&
        member && strcmp(member, "Introspect") == 0) {
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    }
    // Properties
    else if (iface && strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        if (member && strcmp(member, "Get") == 0) {
            reply = handle_get(msg, *g_state);
        } else if (member && strcmp(member, "GetAll") == 0) {
            reply = handle_get_all(msg, *g_state);
        } else if (member && strcmp(member, "Set") == 0) {
            reply = dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
        }
    }
    // Our interface methods
    else if (iface && strcmp(iface, INTERFACE_NAME) == 0) {
        if (member && strcmp(member, "ConnectionStateChanged") == 0) {
            reply = handle_connection_state_changed(msg, g_callbacks);
        } else if (member && strcmp(member, "ActiveDeviceChanged") == 0) {
            reply = handle_active_device_changed(msg, g_callbacks);
        } else if (member && strcmp(member, "DeviceAvailable") == 0) {
            const char* device;
            if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &device, DBUS_TYPE_INVALID)) {
                std::cout << "dbus: DeviceAvailable(" << device << ") called" << std::endl;
                if (g_callbacks && g_callbacks->on_device_available) {
                    g_callbacks->on_device_available(device_arg(device));
                }
                reply = dbus_message_new_method_return(msg);
            } else {
                reply = dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
            }
        } else if (member && strcmp(member, "AudioModeChanged") == 0) {
            const char* mode;
            if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &mode, DBUS_TYPE_INVALID)) {
                auto parsed = arbiter::audio_mode_from_string(mode);
                if (parsed) {
                    std::cout << "dbus: AudioModeChanged(" << mode << ") called" << std::endl;
                    if (g_callbacks && g_callbacks->on_audio_mode_changed) {
                        g_callbacks->on_audio_mode_changed(*parsed);
                    }
                    reply = dbus_message_new_method_return(msg);
                } else {
                    reply = dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Unknown audio mode");
                }
            } else {
                reply = dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
            }
        } else if (member && strcmp(member, "WiredAudioConnected") == 0) {
            std::cout << "dbus: WiredAudioConnected() called" << std::endl;
            if (g_callbacks && g_callbacks->on_wired_audio_connected) {
                g_callbacks->on_wired_audio_connected();
            }
            reply = dbus_message_new_method_return(msg);
        }
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_callbacks = callbacks;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    // Register object path
    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: failed to register object path" << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: " << SERVICE_NAME << " already owned, is another arbiter running?" << std::endl;
        return false;
    }

    std::cout << "dbus: registered service " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(signal, &iter);

    // Interface name
    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    // Changed properties dict
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (int i = 0; i < num_properties; i++) {
        if (const Property* property = find_property(property_names[i])) {
            append_entry(&dict, *property, state);
        }
    }
    dbus_message_iter_close_container(&iter, &dict);

    // Invalidated properties (empty array)
    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void update_from_snapshot(DBusConnection* conn, State* state, const arbiter::Snapshot& snapshot) {
    State next;
    next.classic_media_device = snapshot.active.classic_media.value_or("");
    next.classic_call_device = snapshot.active.classic_call.value_or("");
    next.hearing_aid_device = snapshot.active.hearing_aid.value_or("");
    next.le_audio_media_device = snapshot.active.le_audio_media.value_or("");
    next.le_audio_call_device = snapshot.active.le_audio_call.value_or("");
    next.audio_mode = std::string(arbiter::to_string(snapshot.mode));

    std::vector<const char*> changed;
    for (const auto& property : PROPERTIES) {
        if (state->*property.field != next.*property.field) {
            state->*property.field = next.*property.field;
            changed.push_back(property.name);
        }
    }

    if (!changed.empty()) {
        emit_properties_changed(conn, *state, changed.data(), static_cast<int>(changed.size()));
    }
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
        // Keep processing
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unregister_object_path(conn, OBJECT_PATH);
        dbus_connection_unref(conn);
    }
    g_callbacks = nullptr;
    g_state = nullptr;
}

} // namespace dbus_service
