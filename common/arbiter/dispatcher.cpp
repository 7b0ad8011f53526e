#include "dispatcher.hpp"
#include <iostream>

namespace arbiter {

std::string describe(const Command& command) {
    std::string text = std::string(to_string(command.profile)) + " -> " +
                       (command.device ? *command.device : std::string("none"));
    if (command.profile != Profile::ClassicCall) {
        text += command.suppress_noise ? " (suppress noise)" : "";
    }
    if (!command.notify_profile) text += " [record only]";
    return text;
}

Dispatcher::Dispatcher(Collaborators collaborators, bool dedupe_commands)
    : collaborators_(std::move(collaborators)), dedupe_commands_(dedupe_commands) {}

bool Dispatcher::has_profile(Profile profile) const {
    switch (profile) {
        case Profile::ClassicMedia: return collaborators_.classic_media.has_value();
        case Profile::ClassicCall: return collaborators_.classic_call.has_value();
        case Profile::HearingAid: return collaborators_.hearing_aid.has_value();
        case Profile::LeAudio: return collaborators_.le_audio.has_value();
        case Profile::LeHearingAid: return false;
    }
    return false;
}

bool Dispatcher::dispatch(const Command& command, const ActiveDeviceState& current, bool* sent) {
    if (sent) *sent = false;
    if (!command.notify_profile) return true;

    if (dedupe_commands_ && current.of(command.profile) == command.device) {
        std::cout << "dispatch: skipping repeat " << describe(command) << std::endl;
        return true;
    }

    bool ok = false;
    switch (command.profile) {
        case Profile::ClassicMedia:
        case Profile::HearingAid:
        case Profile::LeAudio: {
            auto& ops = command.profile == Profile::ClassicMedia ? collaborators_.classic_media
                      : command.profile == Profile::HearingAid   ? collaborators_.hearing_aid
                                                                 : collaborators_.le_audio;
            if (!ops || !ops->set_active_device) {
                std::cerr << "dispatch: no " << to_string(command.profile) << " profile" << std::endl;
                return false;
            }
            ok = ops->set_active_device(command.device, command.suppress_noise);
            break;
        }
        case Profile::ClassicCall:
            if (!collaborators_.classic_call || !collaborators_.classic_call->set_active_device) {
                std::cerr << "dispatch: no classic_call profile" << std::endl;
                return false;
            }
            ok = collaborators_.classic_call->set_active_device(command.device);
            break;
        case Profile::LeHearingAid:
            std::cerr << "dispatch: le_hearing_aid takes no commands" << std::endl;
            return false;
    }

    if (ok) {
        if (sent) *sent = true;
        std::cout << "dispatch: " << describe(command) << std::endl;
    } else {
        std::cerr << "dispatch: " << describe(command) << " failed" << std::endl;
    }
    return ok;
}

std::optional<DeviceId> Dispatcher::fallback_device(Profile profile) {
    std::function<std::optional<DeviceId>()>* query = nullptr;
    switch (profile) {
        case Profile::ClassicMedia:
            if (collaborators_.classic_media) query = &collaborators_.classic_media->get_fallback_device;
            break;
        case Profile::ClassicCall:
            if (collaborators_.classic_call) query = &collaborators_.classic_call->get_fallback_device;
            break;
        case Profile::HearingAid:
            if (collaborators_.hearing_aid) query = &collaborators_.hearing_aid->get_fallback_device;
            break;
        case Profile::LeAudio:
            if (collaborators_.le_audio) query = &collaborators_.le_audio->get_fallback_device;
            break;
        case Profile::LeHearingAid:
            break;
    }
    if (!query || !*query) return std::nullopt;

    auto device = (*query)();
    if (device && device->empty()) return std::nullopt;
    return device;
}

} // namespace arbiter
