#include "classifier.hpp"
#include <iostream>

namespace arbiter {

namespace {

bool has_device(const std::optional<DeviceId>& device) {
    return device && !device->empty();
}

struct Describer {
    std::string operator()(const ConnectedEvent& e) const {
        return std::string(to_string(e.profile)) + " connected " + e.device;
    }
    std::string operator()(const DisconnectedEvent& e) const {
        return std::string(to_string(e.profile)) + " disconnected " + e.device;
    }
    std::string operator()(const ActiveChangedEvent& e) const {
        return std::string(to_string(e.profile)) + " active -> " +
               (e.device ? *e.device : std::string("none"));
    }
    std::string operator()(const AvailableEvent& e) const {
        return "le hearing aid available " + e.device;
    }
    std::string operator()(const AudioModeChangedEvent& e) const {
        return "audio mode -> " + std::string(to_string(e.mode));
    }
    std::string operator()(const WiredAudioConnectedEvent&) const {
        return "wired audio connected";
    }
};

struct ProfileOf {
    std::optional<Profile> operator()(const ConnectedEvent& e) const { return e.profile; }
    std::optional<Profile> operator()(const DisconnectedEvent& e) const { return e.profile; }
    std::optional<Profile> operator()(const ActiveChangedEvent& e) const { return e.profile; }
    std::optional<Profile> operator()(const AvailableEvent&) const { return Profile::LeHearingAid; }
    std::optional<Profile> operator()(const AudioModeChangedEvent&) const { return std::nullopt; }
    std::optional<Profile> operator()(const WiredAudioConnectedEvent&) const { return std::nullopt; }
};

} // anonymous namespace

std::optional<Profile> profile_of(const Event& event) {
    return std::visit(ProfileOf{}, event);
}

std::string describe(const Event& event) {
    return std::visit(Describer{}, event);
}

namespace classify {

std::optional<Event> connection_state_changed(Profile profile,
                                              const std::optional<DeviceId>& device,
                                              ConnectionState prev,
                                              ConnectionState next) {
    if (!has_device(device)) {
        std::cerr << "arbiter: dropping " << to_string(profile)
                  << " connection state change without a device" << std::endl;
        return std::nullopt;
    }
    if (prev == next) return std::nullopt;

    if (next == ConnectionState::Connected) {
        if (profile == Profile::LeHearingAid) return AvailableEvent{*device};
        return ConnectedEvent{profile, *device};
    }
    if (next == ConnectionState::Disconnected) {
        return DisconnectedEvent{profile, *device};
    }
    // Connecting / Disconnecting carry no arbitration meaning
    return std::nullopt;
}

std::optional<Event> active_device_changed(Profile profile,
                                           const std::optional<DeviceId>& device) {
    if (profile == Profile::LeHearingAid) {
        return device_available(device);
    }
    if (!has_device(device)) {
        return ActiveChangedEvent{profile, std::nullopt};
    }
    return ActiveChangedEvent{profile, *device};
}

std::optional<Event> device_available(const std::optional<DeviceId>& device) {
    if (!has_device(device)) {
        std::cerr << "arbiter: dropping availability signal without a device" << std::endl;
        return std::nullopt;
    }
    return AvailableEvent{*device};
}

Event audio_mode_changed(AudioMode mode) {
    return AudioModeChangedEvent{mode};
}

Event wired_audio_connected() {
    return WiredAudioConnectedEvent{};
}

} // namespace classify

} // namespace arbiter
