#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <filesystem>
#include "config.hpp"
#include "networking.hpp"
#include "device_registry.hpp"
#include "transfer.hpp"
#include "events.hpp"

namespace app {

/**
 * One running peer: discovery, the upload receiver and the state they feed.
 * Background tasks only push into the registry, the catalogue and the event
 * queue; consumers read through the accessors below.
 */
class Node {
public:
    explicit Node(config::Config cfg);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Throws if the HTTP port cannot be bound. A stopped node can be started again.
    void start();
    void stop();

    // Discovery without the receiver. With announce = false nothing is
    // broadcast, so peers never learn an HTTP port nobody listens on.
    void start_discovery(bool announce = true);

    bool send_file(const std::string& device_id, const std::string& filepath);

    // Returns how many of the files were delivered
    std::size_t send_files(const std::string& device_id, const std::vector<std::string>& filepaths);

    // Forget every known device and announce immediately
    void refresh();

    const std::string& id() const { return id_; }
    const std::string& name() const { return config_.device_name; }
    unsigned short http_port() const;

    std::vector<networking::Device> devices() const { return registry_.list(); }
    std::vector<protocol::ReceivedFile> received() const { return catalogue_.list(); }
    events::EventQueue& events() { return events_; }

    std::filesystem::path save_dir() const;
    void set_save_dir(const std::filesystem::path& dir);

private:
    void on_device_found(const networking::Device& device);
    void on_file_received(const protocol::ReceivedFile& file);

    config::Config config_;
    std::string id_;

    networking::DeviceRegistry registry_;
    transfer::FileCatalogue catalogue_;
    events::EventQueue events_;

    mutable std::mutex save_dir_mutex_;
    std::filesystem::path save_dir_;

    std::unique_ptr<transfer::FileReceiver> receiver_;
    std::unique_ptr<networking::DiscoveryService> discovery_;
};

} // namespace app
