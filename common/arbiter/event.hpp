#pragma once

#include "../types/device.hpp"
#include "../types/enums.hpp"
#include <optional>
#include <string>
#include <variant>

namespace arbiter {

struct ConnectedEvent {
    Profile profile;
    DeviceId device;
};

struct DisconnectedEvent {
    Profile profile;
    DeviceId device;
};

// Explicit selection made outside the engine. A missing device means the
// profile reported that it has no active device.
struct ActiveChangedEvent {
    Profile profile;
    std::optional<DeviceId> device;
};

// LE hearing-aid capability announced for a device
struct AvailableEvent {
    DeviceId device;
};

struct AudioModeChangedEvent {
    AudioMode mode;
};

struct WiredAudioConnectedEvent {};

using Event = std::variant<ConnectedEvent, DisconnectedEvent, ActiveChangedEvent,
                           AvailableEvent, AudioModeChangedEvent, WiredAudioConnectedEvent>;

// Profile an event arrived on, if any
std::optional<Profile> profile_of(const Event& event);

std::string describe(const Event& event);

} // namespace arbiter
