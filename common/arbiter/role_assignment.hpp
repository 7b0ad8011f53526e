#pragma once

#include "../types/enums.hpp"

namespace arbiter {

// What a profile's device can carry
enum class Capability : uint8_t {
    MediaOnly,  // classic media
    CallOnly,   // classic call
    Unified,    // LE audio, one device serves both roles
    Combined,   // hearing aid, single mode-insensitive role
};

struct RoleSet {
    bool media = false;
    bool call = false;

    bool has(AudioRole role) const { return role == AudioRole::Media ? media : call; }
    bool empty() const { return !media && !call; }
    bool operator==(const RoleSet& other) const = default;
};

struct RoleAssignment {
    RoleSet roles;
    // Role the device is selected for under the current mode
    AudioRole primary = AudioRole::Media;

    bool operator==(const RoleAssignment& other) const = default;
};

Capability capability_of(Profile profile);

// Normal mode prefers media, in-call mode prefers call
AudioRole preferred_role(AudioMode mode);

// Roles a device of the given capability occupies if activated now.
// Pure; the only place mode logic lives.
RoleAssignment assign_roles(Capability capability, AudioMode mode);

// Profile that carries a tier-1 role within a group
Profile profile_for(ProfileGroup group, AudioRole role);

} // namespace arbiter
