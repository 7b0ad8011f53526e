#include "pipewire.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <initializer_list>
#include <iostream>

#include <pipewire/pipewire.h>

namespace pipewire {

namespace {

struct Context {
    pw_main_loop* loop = nullptr;
    pw_context* context = nullptr;
    pw_core* core = nullptr;
    pw_registry* registry = nullptr;
    spa_hook registry_listener{};
    spa_hook core_listener{};
    std::vector<std::string> nodes;
    int sync_seq = 0;
};

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    std::string lower(haystack);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(needles.begin(), needles.end(), [&](const char* needle) {
        return lower.find(needle) != std::string::npos;
    });
}

void on_core_done(void* data, uint32_t id, int seq) {
    auto* ctx = static_cast<Context*>(data);
    if (id == PW_ID_CORE && seq == ctx->sync_seq)
        pw_main_loop_quit(ctx->loop);
}

void on_core_error(void*, uint32_t, int, int, const char* msg) {
    std::cerr << "pipewire error: " << msg << std::endl;
}

const pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
    .error = on_core_error,
};

void on_registry_global(void* data, uint32_t, uint32_t, const char* type,
                        uint32_t, const spa_dict* props) {
    auto* ctx = static_cast<Context*>(data);

    if (!props || strcmp(type, PW_TYPE_INTERFACE_Node) != 0)
        return;

    const char* media_class = spa_dict_lookup(props, "media.class");
    if (!media_class || strcmp(media_class, "Audio/Sink") != 0)
        return;

    const char* node_name = spa_dict_lookup(props, "node.name");
    if (!node_name)
        return;

    const char* form_factor = spa_dict_lookup(props, "device.form-factor");
    if (!is_wired_output(node_name, form_factor ? form_factor : ""))
        return;

    ctx->nodes.emplace_back(node_name);
}

const pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
};

} // anonymous namespace

bool is_wired_output(const std::string& node_name, const std::string& form_factor) {
    // Bluetooth sinks are bluez_output.*, only ALSA ones can be wired
    if (node_name.rfind("alsa_output", 0) != 0)
        return false;

    if (form_factor == "headphone" || form_factor == "headset")
        return true;

    return contains_any(node_name, {"headphone", "headset", "usb"});
}

WiredOutputs list_wired_outputs() {
    pw_init(nullptr, nullptr);

    WiredOutputs result;
    Context ctx;

    ctx.loop = pw_main_loop_new(nullptr);
    if (!ctx.loop) return result;

    ctx.context = pw_context_new(pw_main_loop_get_loop(ctx.loop), nullptr, 0);
    if (!ctx.context) {
        pw_main_loop_destroy(ctx.loop);
        return result;
    }

    ctx.core = pw_context_connect(ctx.context, nullptr, 0);
    if (!ctx.core) {
        pw_context_destroy(ctx.context);
        pw_main_loop_destroy(ctx.loop);
        return result;
    }

    pw_core_add_listener(ctx.core, &ctx.core_listener, &core_events, &ctx);

    ctx.registry = pw_core_get_registry(ctx.core, PW_VERSION_REGISTRY, 0);
    if (!ctx.registry) {
        pw_core_disconnect(ctx.core);
        pw_context_destroy(ctx.context);
        pw_main_loop_destroy(ctx.loop);
        return result;
    }

    pw_registry_add_listener(ctx.registry, &ctx.registry_listener, &registry_events, &ctx);
    ctx.sync_seq = pw_core_sync(ctx.core, PW_ID_CORE, 0);

    // Timeout after 2 seconds
    auto* loop = pw_main_loop_get_loop(ctx.loop);
    auto* timer = pw_loop_add_timer(loop, [](void* d, uint64_t) {
        pw_main_loop_quit(static_cast<Context*>(d)->loop);
    }, &ctx);
    timespec ts = {2, 0};
    pw_loop_update_timer(loop, timer, &ts, nullptr, false);

    pw_main_loop_run(ctx.loop);

    // Cleanup
    pw_loop_destroy_source(loop, timer);
    pw_proxy_destroy(reinterpret_cast<pw_proxy*>(ctx.registry));
    pw_core_disconnect(ctx.core);
    pw_context_destroy(ctx.context);
    pw_main_loop_destroy(ctx.loop);

    result.ok = true;
    result.nodes = std::move(ctx.nodes);
    return result;
}

} // namespace pipewire
