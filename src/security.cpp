#include "security.hpp"
#include <sodium.h>
#include <random>
#include <vector>
#include <iostream>

namespace security {

namespace {

bool sodium_ready() {
    static const bool ready = [] {
        if (sodium_init() < 0) {
            std::cerr << "libsodium initialization failed!\n";
            return false;
        }
        return true;
    }();
    return ready;
}

} // namespace

std::string random_hex(std::size_t length) {
    std::size_t byte_count = (length + 1) / 2;
    std::vector<unsigned char> bytes(byte_count);

    if (sodium_ready()) {
        randombytes_buf(bytes.data(), bytes.size());
    } else {
        // Fallback to std::random_device
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(dist(gen));
        }
    }

    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(length);
    return hex;
}

std::string generate_device_id() {
    return random_hex(12);
}

std::string generate_file_id() {
    return random_hex(8);
}

std::string generate_boundary() {
    return "----PeerDropBoundary" + random_hex(32);
}

std::string generate_suffix() {
    return random_hex(6);
}

} // namespace security
