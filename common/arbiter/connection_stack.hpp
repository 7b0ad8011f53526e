#pragma once

#include "../types/device.hpp"
#include <optional>
#include <vector>

namespace arbiter {

// Connection order for one profile, oldest first, no duplicates
class ConnectionStack {
public:
    // Append, or move to tail if already present
    void push(const DeviceId& device);

    // Returns false if the device was not on the stack
    bool remove(const DeviceId& device);

    bool contains(const DeviceId& device) const;
    std::optional<DeviceId> tail() const;

    // True if `a` was pushed more recently than `b`. A device that is not
    // on the stack is older than any device that is.
    bool newer(const DeviceId& a, const DeviceId& b) const;

    bool empty() const { return devices_.empty(); }
    size_t size() const { return devices_.size(); }
    const std::vector<DeviceId>& devices() const { return devices_; }

private:
    std::vector<DeviceId> devices_;
};

} // namespace arbiter
