#pragma once

#include "event.hpp"
#include <optional>

// Normalizes raw profile signals into typed events. Anything that does not
// matter to arbitration, or that is malformed, is logged and comes back as
// std::nullopt.
namespace arbiter::classify {

// Only transitions into Connected or into Disconnected produce an event.
// LE hearing-aid connections are reported as availability.
std::optional<Event> connection_state_changed(Profile profile,
                                              const std::optional<DeviceId>& device,
                                              ConnectionState prev,
                                              ConnectionState next);

std::optional<Event> active_device_changed(Profile profile,
                                           const std::optional<DeviceId>& device);

std::optional<Event> device_available(const std::optional<DeviceId>& device);

Event audio_mode_changed(AudioMode mode);

Event wired_audio_connected();

} // namespace arbiter::classify
