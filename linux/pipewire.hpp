#pragma once

#include <string>
#include <vector>

namespace pipewire {

// Node names of wired (ALSA headphone, headset or USB) audio sinks currently
// in the PipeWire graph. `ok` is false when PipeWire could not be reached.
struct WiredOutputs {
    bool ok = false;
    std::vector<std::string> nodes;
};

WiredOutputs list_wired_outputs();

// Check if an ALSA sink looks like a wired headset or headphone output
bool is_wired_output(const std::string& node_name, const std::string& form_factor);

} // namespace pipewire
