#include "connection_stack.hpp"
#include <algorithm>

namespace arbiter {

void ConnectionStack::push(const DeviceId& device) {
    remove(device);
    devices_.push_back(device);
}

bool ConnectionStack::remove(const DeviceId& device) {
    auto it = std::find(devices_.begin(), devices_.end(), device);
    if (it == devices_.end()) return false;
    devices_.erase(it);
    return true;
}

bool ConnectionStack::contains(const DeviceId& device) const {
    return std::find(devices_.begin(), devices_.end(), device) != devices_.end();
}

std::optional<DeviceId> ConnectionStack::tail() const {
    if (devices_.empty()) return std::nullopt;
    return devices_.back();
}

bool ConnectionStack::newer(const DeviceId& a, const DeviceId& b) const {
    auto ia = std::find(devices_.begin(), devices_.end(), a);
    auto ib = std::find(devices_.begin(), devices_.end(), b);
    if (ia == devices_.end()) return false;
    if (ib == devices_.end()) return true;
    return ia > ib;
}

} // namespace arbiter
