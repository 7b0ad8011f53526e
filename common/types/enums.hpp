#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace arbiter {

// Profile services that report connection and active-device signals
enum class Profile : uint8_t {
    ClassicMedia = 0,
    ClassicCall = 1,
    HearingAid = 2,
    LeAudio = 3,
    LeHearingAid = 4,
};

constexpr uint8_t profile_count = 5;

inline std::string_view to_string(Profile profile) {
    switch (profile) {
        case Profile::ClassicMedia: return "classic_media";
        case Profile::ClassicCall: return "classic_call";
        case Profile::HearingAid: return "hearing_aid";
        case Profile::LeAudio: return "le_audio";
        case Profile::LeHearingAid: return "le_hearing_aid";
    }
    return "unknown";
}

inline std::optional<Profile> profile_from_string(std::string_view s) {
    if (s == "classic_media" || s == "a2dp") return Profile::ClassicMedia;
    if (s == "classic_call" || s == "hfp") return Profile::ClassicCall;
    if (s == "hearing_aid") return Profile::HearingAid;
    if (s == "le_audio") return Profile::LeAudio;
    if (s == "le_hearing_aid" || s == "hap") return Profile::LeHearingAid;
    return std::nullopt;
}

// HearingAid is tier 0. ClassicMediaCall and LeAudio share tier 1 and
// exclude each other.
enum class ProfileGroup : uint8_t {
    HearingAid,
    ClassicMediaCall,
    LeAudio,
};

inline ProfileGroup group_of(Profile profile) {
    switch (profile) {
        case Profile::ClassicMedia:
        case Profile::ClassicCall:
            return ProfileGroup::ClassicMediaCall;
        case Profile::HearingAid:
            return ProfileGroup::HearingAid;
        case Profile::LeAudio:
        case Profile::LeHearingAid:
            return ProfileGroup::LeAudio;
    }
    return ProfileGroup::ClassicMediaCall;
}

inline std::string_view to_string(ProfileGroup group) {
    switch (group) {
        case ProfileGroup::HearingAid: return "hearing_aid";
        case ProfileGroup::ClassicMediaCall: return "classic";
        case ProfileGroup::LeAudio: return "le_audio";
    }
    return "unknown";
}

// Roles that can each hold at most one active device
enum class Role : uint8_t {
    ClassicMedia,
    ClassicCall,
    HearingAid,
    LeAudioMedia,
    LeAudioCall,
};

inline std::string_view to_string(Role role) {
    switch (role) {
        case Role::ClassicMedia: return "classic_media";
        case Role::ClassicCall: return "classic_call";
        case Role::HearingAid: return "hearing_aid";
        case Role::LeAudioMedia: return "le_audio_media";
        case Role::LeAudioCall: return "le_audio_call";
    }
    return "unknown";
}

enum class AudioRole : uint8_t {
    Media,
    Call,
};

inline std::string_view to_string(AudioRole role) {
    return role == AudioRole::Media ? "media" : "call";
}

enum class AudioMode : uint8_t {
    Normal,
    InCall,
};

inline std::string_view to_string(AudioMode mode) {
    switch (mode) {
        case AudioMode::Normal: return "normal";
        case AudioMode::InCall: return "in_call";
    }
    return "unknown";
}

inline std::optional<AudioMode> audio_mode_from_string(std::string_view s) {
    if (s == "normal") return AudioMode::Normal;
    if (s == "in_call" || s == "call" || s == "in_communication") return AudioMode::InCall;
    return std::nullopt;
}

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
};

inline std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnecting: return "disconnecting";
    }
    return "unknown";
}

inline std::optional<ConnectionState> connection_state_from_string(std::string_view s) {
    if (s == "disconnected") return ConnectionState::Disconnected;
    if (s == "connecting") return ConnectionState::Connecting;
    if (s == "connected") return ConnectionState::Connected;
    if (s == "disconnecting") return ConnectionState::Disconnecting;
    return std::nullopt;
}

} // namespace arbiter
