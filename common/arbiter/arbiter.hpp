#pragma once

#include "config.hpp"
#include "collaborators.hpp"
#include "dispatcher.hpp"
#include "event_queue.hpp"
#include "resolver.hpp"
#include "state.hpp"
#include <chrono>
#include <mutex>

namespace arbiter {

// What readers on other threads get to see
struct Snapshot {
    ActiveDeviceState active;
    AudioMode mode = AudioMode::Normal;
};

// Picks the single active device per audio role across the profile
// services. Signal entry points may be called from any thread; all
// decisions run on one worker in arrival order.
class ActiveDeviceArbiter {
public:
    ActiveDeviceArbiter(Config config, Collaborators collaborators);
    ~ActiveDeviceArbiter();

    ActiveDeviceArbiter(const ActiveDeviceArbiter&) = delete;
    ActiveDeviceArbiter& operator=(const ActiveDeviceArbiter&) = delete;

    bool start();

    // Stops the worker and forgets all state
    void cleanup();

    void on_connection_state_changed(Profile profile, const std::optional<DeviceId>& device,
                                     ConnectionState prev, ConnectionState next);
    void on_active_device_changed(Profile profile, const std::optional<DeviceId>& device);
    void on_device_available(const std::optional<DeviceId>& device);
    void on_audio_mode_changed(AudioMode mode);
    void wired_audio_device_connected();

    std::optional<DeviceId> get_active_device(Role role) const;
    AudioMode audio_mode() const;
    Snapshot snapshot() const;

    bool profile_enabled(Profile profile) const { return enabled_.has(profile); }

    // Blocks until every posted event has been handled
    bool wait_for_idle(std::chrono::milliseconds timeout);

private:
    void post(std::optional<Event> event);
    void handle(const Event& event);
    // Dispatch, then commit on success
    bool apply(const Command& command);
    void publish();

    Config config_;
    ProfileMask enabled_;
    Dispatcher dispatcher_;
    Resolver resolver_;
    EventQueue queue_;

    // Worker thread only
    ArbiterState state_;

    mutable std::mutex snapshot_mutex_;
    Snapshot snapshot_;
};

} // namespace arbiter
