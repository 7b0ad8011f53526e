#pragma once

#include "connection_stack.hpp"
#include "../types/active_state.hpp"
#include "../types/device.hpp"
#include <algorithm>
#include <array>
#include <deque>
#include <optional>
#include <unordered_map>

namespace arbiter {

// Everything the resolver reads and the worker mutates. Owned by one
// thread; other threads only ever see copies.
struct ArbiterState {
    ActiveDeviceState active;
    AudioMode mode = AudioMode::Normal;

    ConnectionStack classic_media;
    ConnectionStack classic_call;
    ConnectionStack hearing_aid;
    ConnectionStack le_audio;

    // Devices announced as LE hearing-aid capable, oldest first
    ConnectionStack le_hearing_aid_marks;

    // Every connected device across profiles, for cross-group tie-breaks
    ConnectionStack recency;

    // Profile membership per device
    std::unordered_map<DeviceId, ProfileMask> devices;

    // Role LE audio was selected for; decides hand-off on mode switch
    AudioRole le_audio_primary = AudioRole::Media;

    // Devices sent to each profile whose ActiveDeviceChanged echo has not
    // come back yet, oldest first. Bounded for profiles that never echo.
    static constexpr size_t MAX_AWAITED_ACKS = 8;
    std::array<std::deque<std::optional<DeviceId>>, profile_count> awaited_acks;

    void expect_ack(Profile profile, const std::optional<DeviceId>& device) {
        auto& awaited = awaited_acks[static_cast<size_t>(profile)];
        awaited.push_back(device);
        if (awaited.size() > MAX_AWAITED_ACKS) awaited.pop_front();
    }

    // Consumes the echo of an earlier command, and the older echoes it
    // overtook. False if no outstanding command sent `device`.
    bool take_ack(Profile profile, const std::optional<DeviceId>& device) {
        auto& awaited = awaited_acks[static_cast<size_t>(profile)];
        auto it = std::find(awaited.begin(), awaited.end(), device);
        if (it == awaited.end()) return false;
        awaited.erase(awaited.begin(), it + 1);
        return true;
    }

    ConnectionStack& stack(Profile profile) {
        switch (profile) {
            case Profile::ClassicMedia: return classic_media;
            case Profile::ClassicCall: return classic_call;
            case Profile::HearingAid: return hearing_aid;
            case Profile::LeAudio: return le_audio;
            case Profile::LeHearingAid: return le_hearing_aid_marks;
        }
        return classic_media;
    }

    bool marked(const DeviceId& device) const {
        return le_hearing_aid_marks.contains(device);
    }

    // HearingAid active, or LE audio active on a marked device
    bool hearing_aid_class_active() const {
        if (active.hearing_aid) return true;
        return active.le_audio_media && marked(*active.le_audio_media);
    }
};

} // namespace arbiter
