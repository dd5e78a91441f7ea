#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// One completed upload. Created once, never mutated afterwards.
struct ReceivedFile {
    std::string id;     // 8 hex chars
    std::string name;   // sanitized, no directory components
    uint64_t size;
    std::string path;   // final on-disk location
    std::string time;   // ISO-8601, local time
};

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ReceivedFile, id, name, size, path, time)

} // namespace protocol
