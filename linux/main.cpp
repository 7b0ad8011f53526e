#include "dbus.hpp"
#include "pipewire.hpp"
#include "profiles.hpp"

#include <arbiter/arbiter.hpp>
#include <arbiter/config.hpp>

#include <poll.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

// Global state (for daemon mode)
static std::atomic<bool> g_running{true};
static DBusConnection* g_session_dbus = nullptr;
static DBusConnection* g_profiles_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;
static profiles::FallbackCache g_fallbacks;

// Signal handler
static void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_running = false;
}

// Tracks wired sinks between PipeWire scans
class WiredWatch {
public:
    explicit WiredWatch(std::chrono::milliseconds interval) : interval_(interval) {}

    // Returns true if a sink appeared since the previous scan
    bool poll(std::chrono::steady_clock::time_point now) {
        if (scanned_ && now - last_scan_ < interval_) return false;
        last_scan_ = now;

        auto outputs = pipewire::list_wired_outputs();
        if (!outputs.ok) {
            if (!warned_) std::cerr << "pipewire: not reachable, wired detection paused" << std::endl;
            warned_ = true;
            return false;
        }
        warned_ = false;

        bool appeared = false;
        std::set<std::string> current(outputs.nodes.begin(), outputs.nodes.end());
        for (const auto& node : current) {
            if (!known_.count(node) && scanned_) {
                std::cout << "pipewire: wired output " << node << " appeared" << std::endl;
                appeared = true;
            }
        }
        known_ = std::move(current);
        scanned_ = true;
        return appeared;
    }

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_scan_{};
    std::set<std::string> known_;
    bool scanned_ = false;
    bool warned_ = false;
};

// Main event loop
static void run_event_loop(arbiter::ActiveDeviceArbiter& engine, WiredWatch* wired) {
    while (g_running) {
        std::vector<pollfd> fds;

        int session_fd = dbus_service::get_fd(g_session_dbus);
        if (session_fd >= 0) {
            pollfd pfd = {};
            pfd.fd = session_fd;
            pfd.events = POLLIN;
            fds.push_back(pfd);
        }

        // Poll with 100ms timeout
        int ret = poll(fds.data(), fds.size(), 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        if (!fds.empty() && (fds[0].revents & POLLIN)) {
            dbus_service::process_pending(g_session_dbus);
        }

        if (wired && wired->poll(std::chrono::steady_clock::now())) {
            engine.wired_audio_device_connected();
        }

        dbus_service::update_from_snapshot(g_session_dbus, &g_dbus_state, engine.snapshot());
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_daemon(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 2, argv + argc);
    auto config = arbiter::parse_options(args);
    if (!config) {
        std::cerr << "Usage: " << argv[0] << " daemon [--dedupe] [--no-wired-watch] "
                  << "[--disable <profile>] [--mode <mode>] [--wired-poll-ms <n>]" << std::endl;
        return 1;
    }

    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "Audio arbiter starting..." << std::endl;

    // Profile calls come from the arbiter worker thread
    if (!dbus_threads_init_default()) {
        std::cerr << "Failed to initialize D-Bus threading" << std::endl;
        return 1;
    }

    DBusError err;
    dbus_error_init(&err);

    g_profiles_dbus = dbus_bus_get_private(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }
    dbus_connection_set_exit_on_disconnect(g_profiles_dbus, FALSE);

    arbiter::ActiveDeviceArbiter engine(*config,
        profiles::make_collaborators(g_profiles_dbus, config->enabled_profiles, g_fallbacks));

    // Classic fallbacks are fetched here, before the engine sees the signal,
    // so its worker never blocks on a profile service
    auto refresh_fallback = [&engine](arbiter::Profile profile) {
        if (profile != arbiter::Profile::ClassicMedia && profile != arbiter::Profile::ClassicCall) return;
        if (!engine.profile_enabled(profile)) return;
        g_fallbacks.refresh(g_profiles_dbus, profile);
    };
    refresh_fallback(arbiter::Profile::ClassicMedia);
    refresh_fallback(arbiter::Profile::ClassicCall);

    g_dbus_callbacks.on_connection_state_changed =
        [&engine, refresh_fallback](arbiter::Profile profile, const std::optional<arbiter::DeviceId>& device,
                                    arbiter::ConnectionState prev, arbiter::ConnectionState next) {
            refresh_fallback(profile);
            engine.on_connection_state_changed(profile, device, prev, next);
        };
    g_dbus_callbacks.on_active_device_changed =
        [&engine, refresh_fallback](arbiter::Profile profile, const std::optional<arbiter::DeviceId>& device) {
            refresh_fallback(profile);
            engine.on_active_device_changed(profile, device);
        };
    g_dbus_callbacks.on_device_available = [&engine](const std::optional<arbiter::DeviceId>& device) {
        engine.on_device_available(device);
    };
    g_dbus_callbacks.on_audio_mode_changed = [&engine](arbiter::AudioMode mode) {
        engine.on_audio_mode_changed(mode);
    };
    g_dbus_callbacks.on_wired_audio_connected = [&engine]() {
        engine.wired_audio_device_connected();
    };

    g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        dbus_connection_close(g_profiles_dbus);
        dbus_connection_unref(g_profiles_dbus);
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_close(g_profiles_dbus);
        dbus_connection_unref(g_profiles_dbus);
        return 1;
    }

    if (!engine.start()) {
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_close(g_profiles_dbus);
        dbus_connection_unref(g_profiles_dbus);
        return 1;
    }

    std::optional<WiredWatch> wired;
    if (config->watch_wired_audio) {
        wired.emplace(std::chrono::milliseconds(config->wired_poll_interval_ms));
    }

    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    run_event_loop(engine, wired ? &*wired : nullptr);

    // Cleanup
    engine.cleanup();
    dbus_service::cleanup(g_session_dbus);
    dbus_connection_close(g_profiles_dbus);
    dbus_connection_unref(g_profiles_dbus);

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

// Call a method on the running daemon, with an optional string argument
static int call_daemon(const char* method, const char* arg) {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }

    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        dbus_service::INTERFACE_NAME,
        method
    );
    if (!msg) {
        std::cerr << "Failed to create D-Bus message" << std::endl;
        dbus_connection_unref(conn);
        return 1;
    }

    if (arg) {
        dbus_message_append_args(msg, DBUS_TYPE_STRING, &arg, DBUS_TYPE_INVALID);
    }

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << method << " failed (is daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return 1;
    }

    if (reply) dbus_message_unref(reply);
    dbus_connection_unref(conn);
    return 0;
}

static int cmd_status() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }

    // Get all properties
    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        "org.freedesktop.DBus.Properties",
        "GetAll"
    );
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    const char* iface = dbus_service::INTERFACE_NAME;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to get status (is daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return 1;
    }

    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry, variant;
                dbus_message_iter_recurse(&dict, &entry);

                const char* prop_name;
                dbus_message_iter_get_basic(&entry, &prop_name);
                dbus_message_iter_next(&entry);
                dbus_message_iter_recurse(&entry, &variant);

                if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_STRING) {
                    const char* val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": " << (val[0] ? val : "(none)") << std::endl;
                }

                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    dbus_connection_unref(conn);
    return 0;
}

static int cmd_mode(const char* mode_str) {
    if (!arbiter::audio_mode_from_string(mode_str)) {
        std::cerr << "Invalid mode: " << mode_str << std::endl;
        std::cerr << "Valid modes: normal, in_call" << std::endl;
        return 1;
    }
    if (call_daemon("AudioModeChanged", mode_str) != 0) return 1;
    std::cout << "Audio mode set to: " << mode_str << std::endl;
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon [options]    Run the arbiter daemon\n"
              << "  status              Show active devices and audio mode\n"
              << "  wired               Report a wired headset, releasing Bluetooth audio\n"
              << "  mode <mode>         Set audio mode (normal, in_call)\n"
              << "  help                Show this help\n"
              << "\n"
              << "Daemon options:\n"
              << "  --disable <profile> Ignore a profile (classic_media, classic_call,\n"
              << "                      hearing_aid, le_audio, le_hearing_aid)\n"
              << "  --mode <mode>       Initial audio mode\n"
              << "  --dedupe            Skip commands that repeat the current state\n"
              << "  --no-wired-watch    Do not watch PipeWire for wired outputs\n"
              << "  --wired-poll-ms <n> PipeWire scan interval\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "daemon") {
        return cmd_daemon(argc, argv);
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "wired") {
        return call_daemon("WiredAudioConnected", nullptr);
    } else if (cmd == "mode") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " mode <mode>\n";
            std::cerr << "Modes: normal, in_call\n";
            return 1;
        }
        return cmd_mode(argv[2]);
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
