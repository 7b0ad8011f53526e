#pragma once

#include "../types/device.hpp"
#include <functional>
#include <optional>

namespace arbiter {

// Profile service taking (device|none, suppress_noise): classic media,
// hearing aid, LE audio
struct MediaProfileOps {
    std::function<bool(const std::optional<DeviceId>& device, bool suppress_noise)> set_active_device;
    std::function<std::optional<DeviceId>()> get_fallback_device;
};

// Classic call takes no noise flag
struct CallProfileOps {
    std::function<bool(const std::optional<DeviceId>& device)> set_active_device;
    std::function<std::optional<DeviceId>()> get_fallback_device;
};

// An absent entry means the profile is not present in this deployment
struct Collaborators {
    std::optional<MediaProfileOps> classic_media;
    std::optional<CallProfileOps> classic_call;
    std::optional<MediaProfileOps> hearing_aid;
    std::optional<MediaProfileOps> le_audio;
};

} // namespace arbiter
