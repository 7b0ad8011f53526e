#include "profiles.hpp"
#include <iostream>

namespace profiles {

static const char* name_of(arbiter::Profile profile) {
    switch (profile) {
        case arbiter::Profile::ClassicMedia: return "ClassicMedia";
        case arbiter::Profile::ClassicCall: return "ClassicCall";
        case arbiter::Profile::HearingAid: return "HearingAid";
        case arbiter::Profile::LeAudio: return "LeAudio";
        case arbiter::Profile::LeHearingAid: return "LeHearingAid";
    }
    return "Unknown";
}

std::string service_name(arbiter::Profile profile) {
    return std::string("org.audioarbiter.") + name_of(profile);
}

std::string object_path(arbiter::Profile profile) {
    return std::string("/org/audioarbiter/") + name_of(profile);
}

bool is_present(DBusConnection* conn, arbiter::Profile profile) {
    DBusError err;
    dbus_error_init(&err);

    std::string name = service_name(profile);
    bool owned = dbus_bus_name_has_owner(conn, name.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "profiles: NameHasOwner(" << name << ") failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }
    return owned;
}

bool set_active_device(DBusConnection* conn, arbiter::Profile profile,
                       const std::optional<arbiter::DeviceId>& device,
                       std::optional<bool> suppress_noise) {
    std::string name = service_name(profile);
    std::string path = object_path(profile);
    DBusMessage* msg = dbus_message_new_method_call(name.c_str(), path.c_str(),
        INTERFACE_NAME, "SetActiveDevice");
    if (!msg) return false;

    const char* address = device ? device->c_str() : "";
    bool ok;
    if (suppress_noise) {
        dbus_bool_t suppress = *suppress_noise;
        ok = dbus_message_append_args(msg, DBUS_TYPE_STRING, &address,
                                      DBUS_TYPE_BOOLEAN, &suppress, DBUS_TYPE_INVALID);
    } else {
        ok = dbus_message_append_args(msg, DBUS_TYPE_STRING, &address, DBUS_TYPE_INVALID);
    }

    // The profile reports the outcome through ActiveDeviceChanged
    dbus_message_set_no_reply(msg, TRUE);
    ok = ok && dbus_connection_send(conn, msg, nullptr);
    dbus_message_unref(msg);

    if (!ok) {
        std::cerr << "profiles: SetActiveDevice on " << name << " could not be sent" << std::endl;
        return false;
    }
    dbus_connection_flush(conn);
    return true;
}

std::optional<arbiter::DeviceId> get_fallback_device(DBusConnection* conn, arbiter::Profile profile) {
    std::string name = service_name(profile);
    std::string path = object_path(profile);
    DBusMessage* msg = dbus_message_new_method_call(name.c_str(), path.c_str(),
        INTERFACE_NAME, "GetFallbackDevice");
    if (!msg) return std::nullopt;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, FALLBACK_TIMEOUT_MS, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "profiles: GetFallbackDevice on " << name << " failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return std::nullopt;
    }

    std::optional<arbiter::DeviceId> result;
    if (reply) {
        const char* address = nullptr;
        if (dbus_message_get_args(reply, nullptr, DBUS_TYPE_STRING, &address, DBUS_TYPE_INVALID) &&
            address && address[0] != '\0') {
            result = address;
        }
        dbus_message_unref(reply);
    }
    return result;
}

void FallbackCache::refresh(DBusConnection* conn, arbiter::Profile profile) {
    store(profile, get_fallback_device(conn, profile));
}

void FallbackCache::store(arbiter::Profile profile, const std::optional<arbiter::DeviceId>& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[static_cast<size_t>(profile)] = device;
}

std::optional<arbiter::DeviceId> FallbackCache::get(arbiter::Profile profile) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_[static_cast<size_t>(profile)];
}

// Only the classic profiles are asked for fallbacks; the engine keeps its
// own order for hearing aids and LE audio
static arbiter::MediaProfileOps media_ops(DBusConnection* conn, arbiter::Profile profile,
                                          const FallbackCache* fallbacks) {
    arbiter::MediaProfileOps ops;
    ops.set_active_device = [conn, profile](const std::optional<arbiter::DeviceId>& device,
                                            bool suppress_noise) {
        return set_active_device(conn, profile, device, suppress_noise);
    };
    if (fallbacks) {
        ops.get_fallback_device = [fallbacks, profile]() { return fallbacks->get(profile); };
    }
    return ops;
}

arbiter::Collaborators make_collaborators(DBusConnection* conn, arbiter::ProfileMask enabled,
                                          const FallbackCache& fallbacks) {
    using arbiter::Profile;
    arbiter::Collaborators collaborators;

    auto wanted = [&](Profile profile) {
        if (!enabled.has(profile)) return false;
        if (!is_present(conn, profile)) {
            std::cout << "profiles: " << service_name(profile) << " not on the bus" << std::endl;
            return false;
        }
        std::cout << "profiles: using " << service_name(profile) << std::endl;
        return true;
    };

    if (wanted(Profile::ClassicMedia)) {
        collaborators.classic_media = media_ops(conn, Profile::ClassicMedia, &fallbacks);
    }
    if (wanted(Profile::ClassicCall)) {
        arbiter::CallProfileOps ops;
        ops.set_active_device = [conn](const std::optional<arbiter::DeviceId>& device) {
            return set_active_device(conn, Profile::ClassicCall, device, std::nullopt);
        };
        ops.get_fallback_device = [&fallbacks]() {
            return fallbacks.get(Profile::ClassicCall);
        };
        collaborators.classic_call = std::move(ops);
    }
    if (wanted(Profile::HearingAid)) {
        collaborators.hearing_aid = media_ops(conn, Profile::HearingAid, nullptr);
    }
    if (wanted(Profile::LeAudio)) {
        collaborators.le_audio = media_ops(conn, Profile::LeAudio, nullptr);
    }
    return collaborators;
}

} // namespace profiles
