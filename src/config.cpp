#include "config.hpp"
#include <stdexcept>
#include <boost/asio/ip/host_name.hpp>
#include <boost/system/error_code.hpp>

namespace config {

namespace {

long parse_number(const std::string& flag, const std::string& value, long min, long max) {
    std::size_t consumed = 0;
    long number = 0;
    try {
        number = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (number < min || number > max) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min)
                                    + " and " + std::to_string(max));
    }
    return number;
}

} // namespace

std::string default_device_name() {
    boost::system::error_code ec;
    std::string name = boost::asio::ip::host_name(ec);
    if (ec || name.empty()) return "peerdrop";
    return name;
}

Config parse_args(int argc, char* argv[], int first, std::vector<std::string>& positional) {
    Config cfg;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " requires a value");
        }
        std::string value = argv[++i];

        if (arg == "--name") {
            if (value.empty()) throw std::invalid_argument("--name must not be empty");
            cfg.device_name = value;
        } else if (arg == "--port") {
            cfg.http_port = static_cast<unsigned short>(parse_number(arg, value, 0, 65535));
        } else if (arg == "--discovery-port") {
            cfg.discovery_port = static_cast<unsigned short>(parse_number(arg, value, 1, 65535));
        } else if (arg == "--broadcast") {
            cfg.broadcast_address = value;
        } else if (arg == "--dir") {
            cfg.save_dir = value;
        } else if (arg == "--interval") {
            cfg.broadcast_interval = std::chrono::seconds(parse_number(arg, value, 1, 60));
        } else if (arg == "--timeout") {
            cfg.send_timeout = std::chrono::seconds(parse_number(arg, value, 1, 3600));
        } else if (arg == "--expire") {
            cfg.peer_expiry = std::chrono::seconds(parse_number(arg, value, 0, 86400));
        } else if (arg == "--format") {
            if (value != "text" && value != "json") {
                throw std::invalid_argument("--format expects text or json, got '" + value + "'");
            }
            cfg.json_output = (value == "json");
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (cfg.device_name.empty()) {
        cfg.device_name = default_device_name();
    }
    return cfg;
}

std::string usage() {
    return
        "Usage:\n"
        "  peerdrop [options]                          Run discovery and receive files\n"
        "  peerdrop discover [seconds] [options]       List devices found on the network\n"
        "  peerdrop send <ip> <port> <file>... [options]\n"
        "\n"
        "Options:\n"
        "  --name <name>             Display name (default: host name)\n"
        "  --port <port>             HTTP port for receiving (default: 8080)\n"
        "  --dir <path>              Where received files are stored (default: ./received)\n"
        "  --interval <seconds>      Announcement interval (default: 3)\n"
        "  --timeout <seconds>       Upload timeout when sending (default: 90)\n"
        "  --expire <seconds>        Forget peers not seen for this long (default: never)\n"
        "  --format <text|json>      Output of the discover listing (default: text)\n"
        "  --discovery-port <port>   UDP discovery port (default: 8766)\n"
        "  --broadcast <address>     Announcement destination (default: 255.255.255.255)\n";
}

} // namespace config
