#pragma once

#include "../types/device.hpp"
#include "../types/enums.hpp"
#include <optional>
#include <span>
#include <string_view>

namespace arbiter {

struct Config {
    // Profiles present in this deployment. A disabled profile is neither
    // listened to nor commanded.
    ProfileMask enabled_profiles = ProfileMask::all();

    // Skip outbound commands that repeat the current state
    bool dedupe_commands = false;

    AudioMode initial_mode = AudioMode::Normal;

    // Host daemon: poll PipeWire for newly attached wired outputs
    bool watch_wired_audio = true;
    int wired_poll_interval_ms = 2000;
};

// Parse daemon options, e.g. {"--disable", "le_audio", "--dedupe"}.
// Returns nullopt (after logging) on unknown or malformed options.
std::optional<Config> parse_options(std::span<const std::string_view> args);

} // namespace arbiter
