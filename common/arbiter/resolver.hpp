#pragma once

#include "command.hpp"
#include "event.hpp"
#include "state.hpp"
#include <functional>
#include <span>

namespace arbiter {

// A profile cleared when another takes over, and how
struct Preemption {
    Profile victim;
    bool suppress_noise;
};

// Roles that must go silent when `taking_over` becomes active
std::span<const Preemption> preemptions_for(Profile taking_over);

class Resolver {
public:
    // Asks a classic profile for its own fallback candidate
    using FallbackQuery = std::function<std::optional<DeviceId>(Profile)>;

    Resolver(ProfileMask enabled, FallbackQuery fallback);

    // Applies bookkeeping (stacks, marks, mode) for the event and returns
    // the role reassignments it calls for. Active roles are left to commit().
    Decision resolve(ArbiterState& state, const Event& event) const;

    void on_event(ArbiterState& state, const ConnectedEvent& event, Decision& out) const;
    void on_event(ArbiterState& state, const DisconnectedEvent& event, Decision& out) const;
    void on_event(ArbiterState& state, const ActiveChangedEvent& event, Decision& out) const;
    void on_event(ArbiterState& state, const AvailableEvent& event, Decision& out) const;
    void on_event(ArbiterState& state, const AudioModeChangedEvent& event, Decision& out) const;
    void on_event(ArbiterState& state, const WiredAudioConnectedEvent& event, Decision& out) const;

private:
    bool enabled(Profile profile) const { return enabled_.has(profile); }

    // Appends a step making `device` active on `profile` plus its preemptions
    void activate(const ArbiterState& state, Profile profile, const DeviceId& device,
                  bool notify_profile, std::optional<bool> suppress_override,
                  Decision& out) const;

    // Picks a replacement after the active device of `profile` went away
    void fall_back(ArbiterState& state, Profile profile, const DeviceId& gone, Decision& out) const;

    std::optional<DeviceId> hearing_aid_candidate(const ArbiterState& state) const;
    std::optional<DeviceId> classic_candidate(Profile profile, const DeviceId& exclude) const;

    void forget_if_gone(ArbiterState& state, const DeviceId& device) const;

    ProfileMask enabled_;
    FallbackQuery fallback_;
};

// Records a successfully applied command in the active state
void commit(ArbiterState& state, const Command& command);

// Checks the between-events invariants of the active state
bool invariants_hold(const ArbiterState& state);

} // namespace arbiter
