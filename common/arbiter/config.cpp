#include "config.hpp"
#include <charconv>
#include <iostream>

namespace arbiter {

std::optional<Config> parse_options(std::span<const std::string_view> args) {
    Config config;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--dedupe") {
            config.dedupe_commands = true;
        } else if (arg == "--no-wired-watch") {
            config.watch_wired_audio = false;
        } else if (arg == "--disable") {
            if (!has_value) {
                std::cerr << "config: --disable needs a profile" << std::endl;
                return std::nullopt;
            }
            auto profile = profile_from_string(args[++i]);
            if (!profile) {
                std::cerr << "config: unknown profile: " << args[i] << std::endl;
                return std::nullopt;
            }
            config.enabled_profiles.clear(*profile);
        } else if (arg == "--mode") {
            if (!has_value) {
                std::cerr << "config: --mode needs a value" << std::endl;
                return std::nullopt;
            }
            auto mode = audio_mode_from_string(args[++i]);
            if (!mode) {
                std::cerr << "config: unknown audio mode: " << args[i] << std::endl;
                return std::nullopt;
            }
            config.initial_mode = *mode;
        } else if (arg == "--wired-poll-ms") {
            if (!has_value) {
                std::cerr << "config: --wired-poll-ms needs a value" << std::endl;
                return std::nullopt;
            }
            std::string_view value = args[++i];
            int ms = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
            if (ec != std::errc() || ptr != value.data() + value.size() || ms <= 0) {
                std::cerr << "config: invalid poll interval: " << value << std::endl;
                return std::nullopt;
            }
            config.wired_poll_interval_ms = ms;
        } else {
            std::cerr << "config: unknown option: " << arg << std::endl;
            return std::nullopt;
        }
    }

    return config;
}

} // namespace arbiter
