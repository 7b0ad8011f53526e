#pragma once

#include "enums.hpp"
#include <cstdint>
#include <string>

namespace arbiter {

// Bluetooth address, "AA:BB:CC:DD:EE:FF". Devices are referenced, never owned.
using DeviceId = std::string;

// One bit per profile. Used both for a device's profile membership
// (the LeHearingAid bit meaning "LE hearing-aid capable") and for the
// set of profiles enabled in a deployment.
struct ProfileMask {
    uint8_t bits = 0;

    static constexpr ProfileMask all() { return ProfileMask{0x1F}; }
    static constexpr ProfileMask none() { return ProfileMask{0x00}; }

    static constexpr uint8_t bit(Profile profile) {
        return static_cast<uint8_t>(1u << static_cast<uint8_t>(profile));
    }

    bool has(Profile profile) const { return (bits & bit(profile)) != 0; }
    void set(Profile profile) { bits |= bit(profile); }
    void clear(Profile profile) { bits &= static_cast<uint8_t>(~bit(profile)); }

    // True while the device is connected on any profile (capability marks excluded)
    bool any_connection() const {
        return (bits & static_cast<uint8_t>(~bit(Profile::LeHearingAid))) != 0;
    }

    bool empty() const { return bits == 0; }
    bool operator==(const ProfileMask& other) const { return bits == other.bits; }
};

} // namespace arbiter
