#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include "protocol/announce.hpp"

namespace config {

struct Config {
    std::string device_name;                       // empty: host name
    unsigned short http_port = 8080;
    unsigned short discovery_port = protocol::DISCOVERY_PORT;
    std::string broadcast_address = "255.255.255.255";
    std::filesystem::path save_dir = "received";
    std::chrono::milliseconds broadcast_interval{3000};
    std::chrono::milliseconds receive_timeout{2000};
    std::chrono::milliseconds send_timeout{90000};
    std::chrono::milliseconds peer_expiry{0};      // 0: peers are never dropped
    bool json_output = false;                      // device listings as JSON
};

// Host name of this machine, "peerdrop" if it cannot be determined
std::string default_device_name();

/**
 * Parses "--flag value" options starting at argv[first]. Arguments that are
 * not options are returned in `positional`, in order.
 * Throws std::invalid_argument on unknown flags, missing values or bad numbers.
 */
Config parse_args(int argc, char* argv[], int first, std::vector<std::string>& positional);

std::string usage();

} // namespace config
