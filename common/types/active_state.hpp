#pragma once

#include "device.hpp"
#include "enums.hpp"
#include <optional>

namespace arbiter {

struct ActiveDeviceState {
    std::optional<DeviceId> classic_media;
    std::optional<DeviceId> classic_call;
    std::optional<DeviceId> hearing_aid;
    std::optional<DeviceId> le_audio_media;
    std::optional<DeviceId> le_audio_call;

    const std::optional<DeviceId>& get(Role role) const {
        switch (role) {
            case Role::ClassicMedia: return classic_media;
            case Role::ClassicCall: return classic_call;
            case Role::HearingAid: return hearing_aid;
            case Role::LeAudioMedia: return le_audio_media;
            case Role::LeAudioCall: return le_audio_call;
        }
        return classic_media;
    }

    // Device currently commanded on a profile. LeAudio reports its media
    // role; both LE roles always move together.
    const std::optional<DeviceId>& of(Profile profile) const {
        switch (profile) {
            case Profile::ClassicMedia: return classic_media;
            case Profile::ClassicCall: return classic_call;
            case Profile::HearingAid: return hearing_aid;
            case Profile::LeAudio:
            case Profile::LeHearingAid:
                return le_audio_media;
        }
        return classic_media;
    }

    bool classic_active() const { return classic_media || classic_call; }
    bool le_audio_active() const { return le_audio_media || le_audio_call; }

    bool operator==(const ActiveDeviceState& other) const = default;
};

} // namespace arbiter
