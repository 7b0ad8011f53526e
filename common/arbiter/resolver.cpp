#include "resolver.hpp"
#include "role_assignment.hpp"
#include <array>
#include <iostream>
#include <unordered_set>

namespace arbiter {

namespace {

// Who goes silent when a profile takes over. ClassicCall has no noise flag.
constexpr std::array<Preemption, 3> HEARING_AID_PREEMPTS = {{
    {Profile::ClassicMedia, true},
    {Profile::ClassicCall, false},
    {Profile::LeAudio, true},
}};

constexpr std::array<Preemption, 3> LE_AUDIO_PREEMPTS = {{
    {Profile::ClassicMedia, true},
    {Profile::ClassicCall, false},
    {Profile::HearingAid, true},
}};

constexpr std::array<Preemption, 2> CLASSIC_MEDIA_PREEMPTS = {{
    {Profile::HearingAid, true},
    {Profile::LeAudio, true},
}};

// A call hand-off carries no media, so LE audio stands down without
// suppressing the noisy-audio notification
constexpr std::array<Preemption, 2> CLASSIC_CALL_PREEMPTS = {{
    {Profile::HearingAid, true},
    {Profile::LeAudio, false},
}};

constexpr std::array<Profile, 4> COMMANDED_PROFILES = {
    Profile::ClassicMedia,
    Profile::ClassicCall,
    Profile::HearingAid,
    Profile::LeAudio,
};

std::string_view name_of(const std::optional<DeviceId>& device) {
    return device ? std::string_view(*device) : std::string_view("none");
}

} // anonymous namespace

std::span<const Preemption> preemptions_for(Profile taking_over) {
    switch (taking_over) {
        case Profile::HearingAid: return HEARING_AID_PREEMPTS;
        case Profile::LeAudio:
        case Profile::LeHearingAid:
            return LE_AUDIO_PREEMPTS;
        case Profile::ClassicMedia: return CLASSIC_MEDIA_PREEMPTS;
        case Profile::ClassicCall: return CLASSIC_CALL_PREEMPTS;
    }
    return {};
}

Resolver::Resolver(ProfileMask enabled, FallbackQuery fallback)
    : enabled_(enabled), fallback_(std::move(fallback)) {}

Decision Resolver::resolve(ArbiterState& state, const Event& event) const {
    Decision out;
    std::visit([&](const auto& e) { on_event(state, e, out); }, event);
    return out;
}

void Resolver::activate(const ArbiterState& state, Profile profile, const DeviceId& device,
                        bool notify_profile, std::optional<bool> suppress_override,
                        Decision& out) const {
    Step step{Command{profile, device, false, notify_profile}, {}};

    for (const auto& preemption : preemptions_for(profile)) {
        if (!enabled(preemption.victim) || !state.active.of(preemption.victim)) continue;
        step.consequences.push_back(Command{preemption.victim, std::nullopt,
                                            suppress_override.value_or(preemption.suppress_noise),
                                            true});
    }

    out.push_back(std::move(step));
}

void Resolver::on_event(ArbiterState& state, const ConnectedEvent& event, Decision& out) const {
    if (event.profile == Profile::LeHearingAid) {
        on_event(state, AvailableEvent{event.device}, out);
        return;
    }

    auto& stack = state.stack(event.profile);
    if (stack.contains(event.device)) {
        std::cout << "resolver: " << event.device << " already connected on "
                  << to_string(event.profile) << std::endl;
        return;
    }
    stack.push(event.device);
    state.recency.push(event.device);
    state.devices[event.device].set(event.profile);

    if (event.profile == Profile::HearingAid) {
        activate(state, Profile::HearingAid, event.device, true, std::nullopt, out);
        return;
    }

    // A marked LE device is a hearing aid in its own right
    if (event.profile == Profile::LeAudio && state.marked(event.device)) {
        activate(state, Profile::LeAudio, event.device, true, std::nullopt, out);
        return;
    }

    if (state.hearing_aid_class_active()) {
        std::cout << "resolver: hearing aid keeps priority over " << event.device << std::endl;
        return;
    }

    ProfileGroup group = group_of(event.profile);
    auto assignment = assign_roles(capability_of(event.profile), state.mode);

    // Only take over from the other tier-1 group when this device covers
    // the role the current mode is about
    bool other_group_active = group == ProfileGroup::LeAudio ? state.active.classic_active()
                                                             : state.active.le_audio_active();
    AudioRole wanted = preferred_role(state.mode);
    if (other_group_active && !assignment.roles.has(wanted)) {
        std::cout << "resolver: " << event.device << " cannot carry " << to_string(wanted)
                  << " in " << to_string(state.mode) << " mode, leaving routing as is" << std::endl;
        return;
    }

    if (group == ProfileGroup::LeAudio) {
        activate(state, Profile::LeAudio, event.device, true, std::nullopt, out);
        return;
    }
    for (AudioRole role : {AudioRole::Media, AudioRole::Call}) {
        if (assignment.roles.has(role)) {
            activate(state, profile_for(group, role), event.device, true, std::nullopt, out);
        }
    }
}

void Resolver::on_event(ArbiterState& state, const DisconnectedEvent& event, Decision& out) const {
    if (event.profile == Profile::LeHearingAid) {
        state.le_hearing_aid_marks.remove(event.device);
        auto it = state.devices.find(event.device);
        if (it != state.devices.end()) it->second.clear(Profile::LeHearingAid);
        forget_if_gone(state, event.device);
        return;
    }

    if (!state.stack(event.profile).remove(event.device)) {
        std::cout << "resolver: " << event.device << " was not connected on "
                  << to_string(event.profile) << std::endl;
        return;
    }
    auto it = state.devices.find(event.device);
    if (it != state.devices.end()) it->second.clear(event.profile);
    forget_if_gone(state, event.device);

    if (state.active.of(event.profile) != event.device) return;

    fall_back(state, event.profile, event.device, out);
}

void Resolver::on_event(ArbiterState& state, const ActiveChangedEvent& event, Decision& out) const {
    if (event.profile == Profile::LeHearingAid) {
        if (event.device) on_event(state, AvailableEvent{*event.device}, out);
        return;
    }

    // Echo of a command sent earlier, possibly already replaced by a newer one
    if (state.take_ack(event.profile, event.device)) {
        std::cout << "resolver: " << to_string(event.profile) << " acknowledged "
                  << (event.device ? *event.device : std::string("none")) << std::endl;
        return;
    }

    if (!event.device) {
        if (state.active.of(event.profile)) {
            out.push_back(Step{Command{event.profile, std::nullopt, false, false}, {}});
        }
        return;
    }

    const DeviceId& device = *event.device;
    state.stack(event.profile).push(device);
    state.recency.push(device);
    state.devices[device].set(event.profile);

    // Acknowledgement of what is already in place
    if (state.active.of(event.profile) == device) return;

    // The profile already switched; record it and only settle the others
    activate(state, event.profile, device, false, std::nullopt, out);
}

void Resolver::on_event(ArbiterState& state, const AvailableEvent& event, Decision&) const {
    state.le_hearing_aid_marks.push(event.device);
    state.devices[event.device].set(Profile::LeHearingAid);
    std::cout << "resolver: " << event.device << " is LE hearing aid capable" << std::endl;
}

void Resolver::on_event(ArbiterState& state, const AudioModeChangedEvent& event, Decision& out) const {
    if (event.mode == state.mode) return;
    state.mode = event.mode;

    if (state.hearing_aid_class_active()) return;

    AudioRole role = preferred_role(state.mode);
    Profile classic = profile_for(ProfileGroup::ClassicMediaCall, role);

    if (state.active.le_audio_active()) {
        if (state.le_audio_primary == role) return;
        if (auto device = classic_candidate(classic, {})) {
            std::cout << "resolver: " << to_string(role) << " moves to " << *device
                      << " on " << to_string(classic) << std::endl;
            activate(state, classic, *device, true, true, out);
            return;
        }
        state.le_audio_primary = role;
        return;
    }

    if (state.active.classic_active() && !state.active.of(classic)) {
        if (auto device = classic_candidate(classic, {})) {
            activate(state, classic, *device, true, std::nullopt, out);
        }
    }
}

void Resolver::on_event(ArbiterState&, const WiredAudioConnectedEvent&, Decision& out) const {
    for (Profile profile : COMMANDED_PROFILES) {
        if (!enabled(profile)) continue;
        out.push_back(Step{Command{profile, std::nullopt, false, true}, {}});
    }
}

void Resolver::fall_back(ArbiterState& state, Profile profile, const DeviceId& gone,
                         Decision& out) const {
    if (auto device = hearing_aid_candidate(state)) {
        Profile target = state.hearing_aid.contains(*device) ? Profile::HearingAid : Profile::LeAudio;
        std::cout << "resolver: falling back to hearing aid " << *device << std::endl;
        activate(state, target, *device, true, std::nullopt, out);
        return;
    }

    AudioRole role = profile == Profile::ClassicMedia ? AudioRole::Media
                   : profile == Profile::ClassicCall  ? AudioRole::Call
                                                      : preferred_role(state.mode);
    Profile classic = profile_for(ProfileGroup::ClassicMediaCall, role);

    std::optional<DeviceId> classic_device = classic_candidate(classic, gone);

    // While the classic group still carries its other role it stays the
    // tier-1 group in charge
    std::optional<DeviceId> le_device;
    bool classic_still_active = group_of(profile) == ProfileGroup::ClassicMediaCall &&
                                state.active.of(profile == Profile::ClassicMedia ? Profile::ClassicCall
                                                                                 : Profile::ClassicMedia);
    if (enabled(Profile::LeAudio) && !classic_still_active) {
        le_device = state.le_audio.tail();
    }

    std::optional<DeviceId> chosen;
    Profile target = classic;
    if (classic_device && le_device) {
        bool le_newer = state.recency.newer(*le_device, *classic_device);
        chosen = le_newer ? le_device : classic_device;
        target = le_newer ? Profile::LeAudio : classic;
    } else if (classic_device) {
        chosen = classic_device;
    } else if (le_device) {
        chosen = le_device;
        target = Profile::LeAudio;
    }

    if (chosen) {
        std::cout << "resolver: " << to_string(profile) << " falls back to " << *chosen
                  << " on " << to_string(target) << std::endl;
        activate(state, target, *chosen, true, std::nullopt, out);
        return;
    }

    std::cout << "resolver: no fallback for " << to_string(profile) << std::endl;
    out.push_back(Step{Command{profile, std::nullopt, false, true}, {}});
}

std::optional<DeviceId> Resolver::hearing_aid_candidate(const ArbiterState& state) const {
    const auto& order = state.recency.devices();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (enabled(Profile::HearingAid) && state.hearing_aid.contains(*it)) return *it;
        if (enabled(Profile::LeAudio) && state.le_audio.contains(*it) && state.marked(*it)) return *it;
    }
    return std::nullopt;
}

std::optional<DeviceId> Resolver::classic_candidate(Profile profile, const DeviceId& exclude) const {
    if (!enabled(profile) || !fallback_) return std::nullopt;
    auto device = fallback_(profile);
    if (!device || device->empty() || *device == exclude) return std::nullopt;
    return device;
}

void Resolver::forget_if_gone(ArbiterState& state, const DeviceId& device) const {
    auto it = state.devices.find(device);
    if (it == state.devices.end()) return;
    if (!it->second.any_connection()) {
        state.recency.remove(device);
    }
    if (it->second.empty()) {
        state.devices.erase(it);
    }
}

void commit(ArbiterState& state, const Command& command) {
    switch (command.profile) {
        case Profile::ClassicMedia:
            state.active.classic_media = command.device;
            break;
        case Profile::ClassicCall:
            state.active.classic_call = command.device;
            break;
        case Profile::HearingAid:
            state.active.hearing_aid = command.device;
            break;
        case Profile::LeAudio:
            state.active.le_audio_media = command.device;
            state.active.le_audio_call = command.device;
            if (command.device) {
                state.le_audio_primary = assign_roles(Capability::Unified, state.mode).primary;
            }
            break;
        case Profile::LeHearingAid:
            break;
    }
}

bool invariants_hold(const ArbiterState& state) {
    const auto& active = state.active;

    if (active.hearing_aid && (active.classic_active() || active.le_audio_active())) {
        std::cerr << "resolver: hearing aid " << name_of(active.hearing_aid)
                  << " shares routing with tier-1 devices" << std::endl;
        return false;
    }
    if (active.classic_media && active.le_audio_media) {
        std::cerr << "resolver: media held by both " << name_of(active.classic_media)
                  << " and " << name_of(active.le_audio_media) << std::endl;
        return false;
    }
    if (active.classic_call && active.le_audio_call) {
        std::cerr << "resolver: call held by both " << name_of(active.classic_call)
                  << " and " << name_of(active.le_audio_call) << std::endl;
        return false;
    }

    for (const ConnectionStack* stack : {&state.classic_media, &state.classic_call,
                                         &state.hearing_aid, &state.le_audio}) {
        std::unordered_set<DeviceId> seen(stack->devices().begin(), stack->devices().end());
        if (seen.size() != stack->size()) {
            std::cerr << "resolver: duplicate device on a connection stack" << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace arbiter
