#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "node.hpp"
#include "transfer.hpp"

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

int run_node(const config::Config& cfg) {
    app::Node node(cfg);
    try {
        node.start();
    } catch (std::exception& e) {
        std::cerr << "Failed to start receiver on port " << cfg.http_port << ": " << e.what() << "\n";
        return 1;
    }

    std::cout << "Device: " << node.name() << " [" << node.id() << "]\n";
    std::cout << "Receiving on " << networking::get_local_ip() << ":" << node.http_port()
              << ", saving to " << node.save_dir().string() << "\n";
    std::cout << "Press Ctrl+C to stop.\n";

    while (g_running) {
        auto event = node.events().wait_pop(std::chrono::milliseconds(200));
        if (event) {
            std::cout << events::describe(*event) << std::endl;
        }
    }

    std::cout << "\nShutting down...\n";
    node.stop();
    return 0;
}

int run_discover(const config::Config& cfg, int seconds) {
    app::Node node(cfg);
    // Listen only: no receiver runs in this mode, so there is no port to announce
    node.start_discovery(false);
    if (!cfg.json_output) {
        std::cout << "Discovering devices for " << seconds << "s...\n";
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    node.stop();

    auto devices = node.devices();
    if (cfg.json_output) {
        std::cout << nlohmann::json(devices).dump(2) << "\n";
        return 0;
    }
    if (devices.empty()) {
        std::cout << "No devices found.\n";
        return 0;
    }
    for (const auto& device : devices) {
        std::cout << device.name << "\t" << device.address << ":" << device.http_port
                  << "\t" << device.id << "\n";
    }
    return 0;
}

int run_send(const config::Config& cfg, const std::vector<std::string>& args) {
    networking::Device device;
    device.id = "direct";
    device.name = args[0];
    device.address = args[0];
    device.last_seen = std::chrono::system_clock::now();
    try {
        int port = std::stoi(args[1]);
        if (port <= 0 || port > 65535) throw std::out_of_range("port");
        device.http_port = static_cast<unsigned short>(port);
    } catch (const std::exception&) {
        std::cerr << "Invalid port: " << args[1] << "\n";
        return 1;
    }

    transfer::SendOptions options;
    options.timeout = cfg.send_timeout;

    std::size_t sent = 0;
    std::size_t total = args.size() - 2;
    for (std::size_t i = 2; i < args.size(); ++i) {
        std::cout << "Sending " << args[i] << "...\n";
        if (transfer::FileSender::send(device, args[i], options)) {
            ++sent;
        }
    }
    std::cout << "Sent " << sent << "/" << total << " file(s) to " << device.address << "\n";
    return sent == total ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string mode = (argc > 1) ? argv[1] : "";
    if (mode == "--help" || mode == "-h") {
        std::cout << config::usage();
        return 0;
    }

    bool has_mode = (mode == "discover" || mode == "send");
    std::vector<std::string> positional;
    config::Config cfg;
    try {
        cfg = config::parse_args(argc, argv, has_mode ? 2 : 1, positional);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << config::usage();
        return 1;
    }

    if (mode == "send") {
        if (positional.size() < 3) {
            std::cerr << config::usage();
            return 1;
        }
        return run_send(cfg, positional);
    }

    if (mode == "discover") {
        int seconds = 10;
        if (!positional.empty()) {
            try {
                seconds = std::stoi(positional[0]);
            } catch (const std::exception&) {
                std::cerr << "Invalid duration: " << positional[0] << "\n";
                return 1;
            }
        }
        return run_discover(cfg, seconds);
    }

    if (!positional.empty()) {
        std::cerr << "Unexpected argument: " << positional[0] << "\n\n" << config::usage();
        return 1;
    }
    return run_node(cfg);
}
