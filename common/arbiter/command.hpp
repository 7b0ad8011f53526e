#pragma once

#include "../types/device.hpp"
#include "../types/enums.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

struct Command {
    Profile profile;
    std::optional<DeviceId> device;  // nullopt clears the profile
    bool suppress_noise = false;
    // False when the profile already knows (explicit external selection):
    // the state is recorded without calling back into the profile.
    bool notify_profile = true;

    bool operator==(const Command& other) const = default;
};

// A reassignment and the exclusivity consequences that follow it.
// Consequences are only applied if the primary command succeeds.
struct Step {
    Command primary;
    std::vector<Command> consequences;

    bool operator==(const Step& other) const = default;
};

using Decision = std::vector<Step>;

std::string describe(const Command& command);

} // namespace arbiter
