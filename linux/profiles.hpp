#pragma once

#include <dbus/dbus.h>
#include <arbiter/collaborators.hpp>
#include <types/device.hpp>
#include <array>
#include <mutex>
#include <optional>
#include <string>

namespace profiles {

// Each profile service owns org.audioarbiter.<Name> and exports
// /org/audioarbiter/<Name> with this interface:
//   SetActiveDevice(s device)              classic_call
//   SetActiveDevice(s device, b suppress)  the others
//   GetFallbackDevice() -> s
// An empty device string means none.
constexpr const char* INTERFACE_NAME = "org.audioarbiter.Profile1";

std::string service_name(arbiter::Profile profile);
std::string object_path(arbiter::Profile profile);

// Check if the profile service currently owns its bus name
bool is_present(DBusConnection* conn, arbiter::Profile profile);

// Fire-and-forget; false only if the message could not be queued
bool set_active_device(DBusConnection* conn, arbiter::Profile profile,
                       const std::optional<arbiter::DeviceId>& device,
                       std::optional<bool> suppress_noise);

// Blocks for at most FALLBACK_TIMEOUT_MS
constexpr int FALLBACK_TIMEOUT_MS = 500;
std::optional<arbiter::DeviceId> get_fallback_device(DBusConnection* conn, arbiter::Profile profile);

// Last fallback each profile reported. The D-Bus thread refreshes an
// entry before handing that profile's signal to the engine; the engine
// worker only reads it and never waits on the bus.
class FallbackCache {
public:
    void refresh(DBusConnection* conn, arbiter::Profile profile);
    void store(arbiter::Profile profile, const std::optional<arbiter::DeviceId>& device);
    std::optional<arbiter::DeviceId> get(arbiter::Profile profile) const;

private:
    mutable std::mutex mutex_;
    std::array<std::optional<arbiter::DeviceId>, arbiter::profile_count> devices_;
};

// Collaborators for every profile in `enabled` that is on the bus.
// `conn` and `fallbacks` must outlive the returned functions.
arbiter::Collaborators make_collaborators(DBusConnection* conn, arbiter::ProfileMask enabled,
                                          const FallbackCache& fallbacks);

} // namespace profiles
