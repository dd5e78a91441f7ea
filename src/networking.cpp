#include "networking.hpp"
#include <iostream>
#include <array>

using boost::asio::ip::udp;

namespace networking {

void to_json(nlohmann::json& j, const Device& device) {
    auto seen_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        device.last_seen.time_since_epoch()).count();
    j = nlohmann::json{
        {"id", device.id},
        {"name", device.name},
        {"address", device.address},
        {"http_port", device.http_port},
        {"last_seen", seen_ms}
    };
}

std::string get_local_ip() {
    try {
        boost::asio::io_context io_context;
        udp::socket socket(io_context);
        // No packet is sent; connect() only selects the outbound interface
        socket.connect(udp::endpoint(boost::asio::ip::make_address("10.255.255.255"), 1));
        return socket.local_endpoint().address().to_string();
    } catch (std::exception&) {
        return "127.0.0.1";
    }
}

// ─── DiscoveryService ───────────────────────────────────────────────────────

DiscoveryService::DiscoveryService(LocalIdentity local, DiscoveryOptions options,
                                   DeviceFoundCallback callback)
    : local_(std::move(local)),
      options_(std::move(options)),
      callback_(std::move(callback)) {}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) return;
    running_ = true;

    listener_thread_ = std::thread([this]() { listen_loop(); });
    if (options_.announce) {
        broadcaster_thread_ = std::thread([this]() { broadcast_loop(); });
    }
}

void DiscoveryService::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        // Under the wait mutex so the broadcaster cannot miss the wakeup
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wake_.notify_all();

    if (listener_thread_.joinable()) listener_thread_.join();
    if (broadcaster_thread_.joinable()) broadcaster_thread_.join();
}

void DiscoveryService::handle_datagram(const std::string& payload, const std::string& sender_ip) {
    auto announcement = protocol::parse_announcement(payload);
    if (!announcement) return;

    // Ignore our own broadcasts
    if (announcement->id == local_.id) return;

    Device device;
    device.id = announcement->id;
    device.name = announcement->name;
    device.address = sender_ip;
    device.http_port = announcement->http_port;
    device.last_seen = std::chrono::system_clock::now();

    if (callback_) callback_(device);
}

void DiscoveryService::listen_loop() {
    try {
        boost::asio::io_context io_context;
        udp::socket socket(io_context);
        socket.open(udp::v4());
        // reuse_address must be set before bind to have any effect
        socket.set_option(boost::asio::socket_base::reuse_address(true));
        socket.set_option(boost::asio::socket_base::broadcast(true));
        socket.bind(udp::endpoint(udp::v4(), options_.port));
        listening_ = true;

        // One spare byte so oversized datagrams are detected rather than truncated
        std::array<char, protocol::MAX_DATAGRAM + 1> recv_buf;
        while (running_) {
            udp::endpoint sender_endpoint;
            boost::system::error_code ec = boost::asio::error::would_block;
            std::size_t len = 0;

            socket.async_receive_from(boost::asio::buffer(recv_buf), sender_endpoint,
                [&ec, &len](const boost::system::error_code& result, std::size_t bytes) {
                    ec = result;
                    len = bytes;
                });

            // Bounded wait so that stop() is observed within one receive timeout
            io_context.restart();
            io_context.run_for(options_.receive_timeout);
            if (!io_context.stopped()) {
                socket.cancel();
                io_context.run();
            }

            if (ec == boost::asio::error::operation_aborted) continue; // timeout
            if (ec) continue;                                          // transient

            try {
                handle_datagram(std::string(recv_buf.data(), len),
                                sender_endpoint.address().to_string());
            } catch (std::exception& e) {
                std::cerr << "DiscoveryService callback exception: " << e.what() << "\n";
            }
        }
    } catch (std::exception& e) {
        std::cerr << "DiscoveryService listener exception: " << e.what() << "\n";
    }
    listening_ = false;
}

bool DiscoveryService::send_announcement(udp::socket& socket, const udp::endpoint& target) {
    std::string message = protocol::encode_announcement(
        protocol::Announcement{local_.id, local_.name, local_.http_port});

    boost::system::error_code ec;
    socket.send_to(boost::asio::buffer(message), target, 0, ec);
    return !ec;
}

void DiscoveryService::broadcast_loop() {
    boost::asio::io_context io_context;
    udp::socket socket(io_context);
    bool warned = false;

    boost::system::error_code ec;
    udp::endpoint target(boost::asio::ip::make_address_v4(options_.broadcast_address, ec),
                         options_.port);
    if (ec) {
        std::cerr << "DiscoveryService: invalid broadcast address "
                  << options_.broadcast_address << "\n";
        return;
    }

    while (running_) {
        if (!socket.is_open()) {
            socket.open(udp::v4(), ec);
            if (!ec) socket.set_option(boost::asio::socket_base::broadcast(true), ec);
            if (ec && socket.is_open()) {
                boost::system::error_code close_ec;
                socket.close(close_ec);
            }
        }

        // Send failures are transient: retry on the next interval
        bool sent = socket.is_open() && send_announcement(socket, target);
        if (!sent && !warned) {
            std::cerr << "DiscoveryService: broadcast failed, will keep retrying\n";
            warned = true;
        } else if (sent) {
            warned = false;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_for(lock, options_.broadcast_interval, [this] { return !running_; });
    }
}

void DiscoveryService::announce_now() {
    if (!options_.announce) return;
    try {
        boost::asio::io_context io_context;
        udp::socket socket(io_context, udp::endpoint(udp::v4(), 0));
        socket.set_option(boost::asio::socket_base::broadcast(true));
        udp::endpoint target(boost::asio::ip::make_address_v4(options_.broadcast_address),
                             options_.port);
        if (!send_announcement(socket, target)) {
            std::cerr << "DiscoveryService: immediate announcement failed\n";
        }
    } catch (std::exception& e) {
        std::cerr << "DiscoveryService announce exception: " << e.what() << "\n";
    }
}

} // namespace networking
