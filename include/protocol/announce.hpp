#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace protocol {

constexpr const char* ANNOUNCE_PREFIX = "PYDROP_ANNOUNCE";
constexpr char ANNOUNCE_DELIMITER = '|';
constexpr unsigned short DISCOVERY_PORT = 8766;
constexpr std::size_t MAX_DATAGRAM = 1024;

// PYDROP_ANNOUNCE|<id>|<name>|<http_port>
struct Announcement {
    std::string id;
    std::string name;
    unsigned short http_port = 0;
};

std::string encode_announcement(const Announcement& announcement);

// Returns std::nullopt for anything that is not a well-formed announcement.
// Never throws.
std::optional<Announcement> parse_announcement(const std::string& payload);

} // namespace protocol
