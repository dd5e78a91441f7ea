#include "node.hpp"
#include "security.hpp"
#include <iostream>

namespace app {

Node::Node(config::Config cfg)
    : config_(std::move(cfg)),
      id_(security::generate_device_id()),
      save_dir_(config_.save_dir) {
    transfer::ReceiverOptions options;
    options.port = config_.http_port;

    receiver_ = std::make_unique<transfer::FileReceiver>(
        options,
        [this]() { return save_dir(); },
        [this](const protocol::ReceivedFile& file) { on_file_received(file); },
        transfer::ServerInfo{id_, config_.device_name});
}

Node::~Node() {
    stop();
}

void Node::start() {
    receiver_->start();
    start_discovery();
}

void Node::start_discovery(bool announce) {
    if (discovery_ && discovery_->is_running()) return;
    events_.reopen();

    networking::DiscoveryOptions options;
    options.port = config_.discovery_port;
    options.broadcast_address = config_.broadcast_address;
    options.broadcast_interval = config_.broadcast_interval;
    options.receive_timeout = config_.receive_timeout;
    options.announce = announce;

    // Rebuilt on every start: the bound port can change between runs, and it
    // differs from the configured one when that is 0
    networking::LocalIdentity local{id_, config_.device_name, http_port()};
    discovery_ = std::make_unique<networking::DiscoveryService>(
        local, options, [this](const networking::Device& device) { on_device_found(device); });
    discovery_->start();
}

void Node::stop() {
    if (receiver_) receiver_->stop();
    if (discovery_) discovery_->stop();
    events_.close();
}

unsigned short Node::http_port() const {
    if (receiver_ && receiver_->is_running()) return receiver_->port();
    return config_.http_port;
}

void Node::on_device_found(const networking::Device& device) {
    if (device.id == id_) return;

    if (config_.peer_expiry.count() > 0) {
        registry_.remove_stale(config_.peer_expiry);
    }

    // Later announcements only refresh the entry
    if (registry_.upsert(device)) {
        events_.push(events::DeviceFound{device});
    }
}

void Node::on_file_received(const protocol::ReceivedFile& file) {
    catalogue_.add(file);
    events_.push(events::FileReceived{file});
}

bool Node::send_file(const std::string& device_id, const std::string& filepath) {
    std::string filename = std::filesystem::path(filepath).filename().string();

    auto device = registry_.get(device_id);
    if (!device) {
        std::cerr << "Unknown device: " << device_id << "\n";
        events_.push(events::SendFailed{filename, device_id});
        return false;
    }

    transfer::SendOptions options;
    options.timeout = config_.send_timeout;

    if (!transfer::FileSender::send(*device, filepath, options)) {
        events_.push(events::SendFailed{filename, device->name});
        return false;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(filepath, ec);
    events_.push(events::FileSent{filename, ec ? 0 : static_cast<uint64_t>(size), device->name});
    return true;
}

std::size_t Node::send_files(const std::string& device_id, const std::vector<std::string>& filepaths) {
    std::size_t delivered = 0;
    for (const auto& path : filepaths) {
        if (send_file(device_id, path)) ++delivered;
    }
    return delivered;
}

void Node::refresh() {
    registry_.clear();
    if (discovery_) discovery_->announce_now();
}

std::filesystem::path Node::save_dir() const {
    std::lock_guard<std::mutex> lock(save_dir_mutex_);
    return save_dir_;
}

void Node::set_save_dir(const std::filesystem::path& dir) {
    std::lock_guard<std::mutex> lock(save_dir_mutex_);
    save_dir_ = dir;
}

} // namespace app
