#include "protocol/announce.hpp"
#include <vector>
#include <algorithm>

namespace protocol {

namespace {

bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t extra;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= s.size()) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

bool has_control_chars(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c < 0x20 || c == 0x7F;
    });
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<unsigned short> parse_port(const std::string& field) {
    if (field.empty() || field.size() > 5) return std::nullopt;
    if (!std::all_of(field.begin(), field.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    unsigned long value = std::stoul(field);
    if (value == 0 || value > 65535) return std::nullopt;
    return static_cast<unsigned short>(value);
}

} // namespace

std::string encode_announcement(const Announcement& announcement) {
    // A pipe inside the name would shift the port into another field
    std::string name = announcement.name;
    std::replace(name.begin(), name.end(), ANNOUNCE_DELIMITER, '_');

    return std::string(ANNOUNCE_PREFIX) + ANNOUNCE_DELIMITER + announcement.id
        + ANNOUNCE_DELIMITER + name
        + ANNOUNCE_DELIMITER + std::to_string(announcement.http_port);
}

std::optional<Announcement> parse_announcement(const std::string& payload) {
    if (payload.size() > MAX_DATAGRAM) return std::nullopt;

    std::string message = payload;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'
                                || message.back() == ' ' || message.back() == '\t')) {
        message.pop_back();
    }

    if (!is_valid_utf8(message) || has_control_chars(message)) return std::nullopt;

    std::vector<std::string> parts = split(message, ANNOUNCE_DELIMITER);
    if (parts.size() < 4) return std::nullopt;
    if (parts[0] != ANNOUNCE_PREFIX) return std::nullopt;
    if (parts[1].empty()) return std::nullopt;

    auto port = parse_port(parts[3]);
    if (!port) return std::nullopt;

    return Announcement{parts[1], parts[2], *port};
}

} // namespace protocol
