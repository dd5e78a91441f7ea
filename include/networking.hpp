#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "protocol/announce.hpp"

namespace networking {

struct Device {
    std::string id;
    std::string name;
    std::string address;   // source IP of the announcement, never the payload
    unsigned short http_port = 0;
    std::chrono::system_clock::time_point last_seen;
};

void to_json(nlohmann::json& j, const Device& device);

using DeviceFoundCallback = std::function<void(const Device&)>;

// Identity this process announces
struct LocalIdentity {
    std::string id;
    std::string name;
    unsigned short http_port = 0;
};

struct DiscoveryOptions {
    unsigned short port = protocol::DISCOVERY_PORT;
    std::string broadcast_address = "255.255.255.255";
    std::chrono::milliseconds broadcast_interval{3000};
    std::chrono::milliseconds receive_timeout{2000};
    bool announce = true;   // false: listen only, nothing is broadcast
};

// Best-effort address of the interface used for outbound traffic
std::string get_local_ip();

/**
 * Announces this process on the local broadcast domain and listens for the
 * announcements of others. Runs a listener and a broadcaster thread between
 * start() and stop().
 */
class DiscoveryService {
public:
    DiscoveryService(LocalIdentity local, DiscoveryOptions options, DeviceFoundCallback callback);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    void start();

    // Returns once both threads have exited: at most one receive timeout
    void stop();

    bool is_running() const { return running_; }

    // True while the listener socket is bound
    bool is_listening() const { return listening_; }

    // Sends one announcement immediately, outside the regular interval.
    // No-op for a listen-only service.
    void announce_now();

    // Handles one received datagram. Malformed payloads and our own
    // announcements are dropped silently.
    void handle_datagram(const std::string& payload, const std::string& sender_ip);

    const LocalIdentity& local() const { return local_; }

private:
    void listen_loop();
    void broadcast_loop();
    bool send_announcement(boost::asio::ip::udp::socket& socket,
                           const boost::asio::ip::udp::endpoint& target);

    LocalIdentity local_;
    DiscoveryOptions options_;
    DeviceFoundCallback callback_;

    std::atomic<bool> running_{false};
    std::atomic<bool> listening_{false};
    std::mutex lifecycle_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable wake_;
    std::thread listener_thread_;
    std::thread broadcaster_thread_;
};

} // namespace networking
