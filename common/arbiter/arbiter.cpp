#include "arbiter.hpp"
#include "classifier.hpp"
#include <iostream>

namespace arbiter {

namespace {

ProfileMask enabled_profiles(const Config& config, const Dispatcher& dispatcher) {
    ProfileMask mask;
    for (uint8_t i = 0; i < profile_count; ++i) {
        auto profile = static_cast<Profile>(i);
        if (!config.enabled_profiles.has(profile)) continue;
        // LE hearing-aid signals only mark devices, nothing to command
        if (profile == Profile::LeHearingAid || dispatcher.has_profile(profile)) {
            mask.set(profile);
        }
    }
    return mask;
}

} // anonymous namespace

ActiveDeviceArbiter::ActiveDeviceArbiter(Config config, Collaborators collaborators)
    : config_(config),
      dispatcher_(std::move(collaborators), config.dedupe_commands),
      resolver_(enabled_profiles(config, dispatcher_),
                [this](Profile profile) { return dispatcher_.fallback_device(profile); }) {
    enabled_ = enabled_profiles(config_, dispatcher_);
    state_.mode = config_.initial_mode;
    snapshot_.mode = config_.initial_mode;

    for (uint8_t i = 0; i < profile_count; ++i) {
        auto profile = static_cast<Profile>(i);
        if (config_.enabled_profiles.has(profile) && !enabled_.has(profile)) {
            std::cout << "arbiter: " << to_string(profile) << " enabled but no profile service, ignoring"
                      << std::endl;
        }
    }
}

ActiveDeviceArbiter::~ActiveDeviceArbiter() {
    queue_.stop();
}

bool ActiveDeviceArbiter::start() {
    if (!queue_.start([this](const Event& event) { handle(event); })) {
        std::cerr << "arbiter: already started" << std::endl;
        return false;
    }
    std::cout << "arbiter: started in " << to_string(state_.mode) << " mode" << std::endl;
    return true;
}

void ActiveDeviceArbiter::cleanup() {
    queue_.stop();

    state_ = ArbiterState{};
    state_.mode = config_.initial_mode;

    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = Snapshot{};
    snapshot_.mode = config_.initial_mode;
}

void ActiveDeviceArbiter::on_connection_state_changed(Profile profile,
                                                      const std::optional<DeviceId>& device,
                                                      ConnectionState prev, ConnectionState next) {
    post(classify::connection_state_changed(profile, device, prev, next));
}

void ActiveDeviceArbiter::on_active_device_changed(Profile profile,
                                                   const std::optional<DeviceId>& device) {
    post(classify::active_device_changed(profile, device));
}

void ActiveDeviceArbiter::on_device_available(const std::optional<DeviceId>& device) {
    post(classify::device_available(device));
}

void ActiveDeviceArbiter::on_audio_mode_changed(AudioMode mode) {
    post(classify::audio_mode_changed(mode));
}

void ActiveDeviceArbiter::wired_audio_device_connected() {
    post(classify::wired_audio_connected());
}

std::optional<DeviceId> ActiveDeviceArbiter::get_active_device(Role role) const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_.active.get(role);
}

AudioMode ActiveDeviceArbiter::audio_mode() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_.mode;
}

Snapshot ActiveDeviceArbiter::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

bool ActiveDeviceArbiter::wait_for_idle(std::chrono::milliseconds timeout) {
    return queue_.wait_for_idle(timeout);
}

void ActiveDeviceArbiter::post(std::optional<Event> event) {
    if (!event) return;

    if (auto profile = profile_of(*event); profile && !enabled_.has(*profile)) {
        std::cout << "arbiter: dropping " << describe(*event) << ", profile disabled" << std::endl;
        return;
    }

    if (!queue_.post(std::move(*event))) {
        std::cerr << "arbiter: not started, dropping signal" << std::endl;
    }
}

void ActiveDeviceArbiter::handle(const Event& event) {
    std::cout << "arbiter: " << describe(event) << std::endl;

    Decision decision = resolver_.resolve(state_, event);

    for (const Step& step : decision) {
        if (!apply(step.primary)) {
            std::cerr << "arbiter: " << describe(step.primary) << " not applied, skipping "
                      << step.consequences.size() << " follow-ups" << std::endl;
            continue;
        }
        for (const Command& command : step.consequences) {
            apply(command);
        }
    }

    if (!invariants_hold(state_)) {
        std::cerr << "arbiter: routing inconsistent after " << describe(event) << std::endl;
    }
    publish();
}

bool ActiveDeviceArbiter::apply(const Command& command) {
    bool sent = false;
    if (!dispatcher_.dispatch(command, state_.active, &sent)) return false;

    // The profile will echo this back as ActiveDeviceChanged
    if (sent) state_.expect_ack(command.profile, command.device);
    commit(state_, command);
    return true;
}

void ActiveDeviceArbiter::publish() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_.active = state_.active;
    snapshot_.mode = state_.mode;
}

} // namespace arbiter
