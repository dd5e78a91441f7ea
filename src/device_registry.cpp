#include "device_registry.hpp"
#include <algorithm>

namespace networking {

bool DeviceRegistry::upsert(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.insert_or_assign(device.id, device).second;
}

std::optional<Device> DeviceRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

std::vector<Device> DeviceRegistry::list() const {
    std::vector<Device> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& entry : devices_) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const Device& a, const Device& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.id < b.id;
    });
    return result;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
}

std::size_t DeviceRegistry::remove_stale(std::chrono::milliseconds max_age,
                                         std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->second.last_seen > max_age) {
            it = devices_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace networking
