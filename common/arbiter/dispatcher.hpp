#pragma once

#include "collaborators.hpp"
#include "command.hpp"
#include "../types/active_state.hpp"

namespace arbiter {

// Turns resolved commands into outbound profile calls
class Dispatcher {
public:
    Dispatcher(Collaborators collaborators, bool dedupe_commands);

    // Returns false if the profile is absent or rejected the call.
    // Record-only commands never reach a profile and always succeed.
    // `sent`, when given, tells whether the profile was actually called.
    bool dispatch(const Command& command, const ActiveDeviceState& current, bool* sent = nullptr);

    bool has_profile(Profile profile) const;

    // Fallback proposed by a profile, nullopt if absent or it has none
    std::optional<DeviceId> fallback_device(Profile profile);

private:
    Collaborators collaborators_;
    bool dedupe_commands_;
};

} // namespace arbiter
