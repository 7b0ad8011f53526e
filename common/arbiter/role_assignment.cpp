#include "role_assignment.hpp"

namespace arbiter {

Capability capability_of(Profile profile) {
    switch (profile) {
        case Profile::ClassicMedia: return Capability::MediaOnly;
        case Profile::ClassicCall: return Capability::CallOnly;
        case Profile::HearingAid: return Capability::Combined;
        case Profile::LeAudio:
        case Profile::LeHearingAid:
            return Capability::Unified;
    }
    return Capability::Unified;
}

AudioRole preferred_role(AudioMode mode) {
    return mode == AudioMode::InCall ? AudioRole::Call : AudioRole::Media;
}

RoleAssignment assign_roles(Capability capability, AudioMode mode) {
    RoleAssignment result;
    switch (capability) {
        case Capability::MediaOnly:
            result.roles.media = true;
            result.primary = AudioRole::Media;
            break;
        case Capability::CallOnly:
            result.roles.call = true;
            result.primary = AudioRole::Call;
            break;
        case Capability::Unified:
            result.roles = {true, true};
            result.primary = preferred_role(mode);
            break;
        case Capability::Combined:
            // Hearing aids ignore the mode
            result.roles = {true, true};
            result.primary = AudioRole::Media;
            break;
    }
    return result;
}

Profile profile_for(ProfileGroup group, AudioRole role) {
    switch (group) {
        case ProfileGroup::ClassicMediaCall:
            return role == AudioRole::Media ? Profile::ClassicMedia : Profile::ClassicCall;
        case ProfileGroup::LeAudio:
            return Profile::LeAudio;
        case ProfileGroup::HearingAid:
            return Profile::HearingAid;
    }
    return Profile::ClassicMedia;
}

} // namespace arbiter
