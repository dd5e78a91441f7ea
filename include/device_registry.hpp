#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <chrono>
#include "networking.hpp"

namespace networking {

/**
 * Thread-safe map of peer id -> last known Device.
 * Repeated announcements overwrite the previous entry (last write wins).
 * Entries are never removed automatically; remove_stale() is only called
 * when an expiry policy has been configured.
 */
class DeviceRegistry {
public:
    // Returns true when the id was not known before
    bool upsert(const Device& device);

    std::optional<Device> get(const std::string& id) const;

    // Sorted by name, then id
    std::vector<Device> list() const;

    std::size_t size() const;
    void clear();

    // Drops devices not seen since `now - max_age`; returns how many were removed
    std::size_t remove_stale(std::chrono::milliseconds max_age,
                             std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    mutable std::mutex mutex_;
    std::map<std::string, Device> devices_;
};

} // namespace networking
