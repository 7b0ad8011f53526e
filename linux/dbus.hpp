#pragma once

#include <dbus/dbus.h>
#include <arbiter/arbiter.hpp>
#include <functional>
#include <optional>
#include <string>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "org.audioarbiter.Arbiter";
constexpr const char* OBJECT_PATH = "/org/audioarbiter/Arbiter";
constexpr const char* INTERFACE_NAME = "org.audioarbiter.Arbiter1";

// Callbacks for method invocations. Arguments are already parsed.
struct Callbacks {
    std::function<void(arbiter::Profile, const std::optional<arbiter::DeviceId>&,
                       arbiter::ConnectionState, arbiter::ConnectionState)> on_connection_state_changed;
    std::function<void(arbiter::Profile, const std::optional<arbiter::DeviceId>&)> on_active_device_changed;
    std::function<void(const std::optional<arbiter::DeviceId>&)> on_device_available;
    std::function<void(arbiter::AudioMode)> on_audio_mode_changed;
    std::function<void()> on_wired_audio_connected;
};

// Current state exposed via D-Bus. Empty string means no device.
struct State {
    std::string classic_media_device;
    std::string classic_call_device;
    std::string hearing_aid_device;
    std::string le_audio_media_device;
    std::string le_audio_call_device;
    std::string audio_mode = "normal";
};

// Initialize D-Bus service, returns connection (caller owns)
// Sets up object path and method handlers
DBusConnection* init(Callbacks* callbacks, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties);

// Update state from an arbiter snapshot and emit signals
void update_from_snapshot(DBusConnection* conn, State* state, const arbiter::Snapshot& snapshot);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

// Cleanup
void cleanup(DBusConnection* conn);

} // namespace dbus_service
