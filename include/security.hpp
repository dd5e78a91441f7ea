#pragma once

#include <string>
#include <cstddef>

namespace security {

// Random lowercase hex string of `length` characters (libsodium CSPRNG)
std::string random_hex(std::size_t length);

// 12 hex chars, generated once per process
std::string generate_device_id();

// 8 hex chars, one per received upload
std::string generate_file_id();

// Multipart boundary token
std::string generate_boundary();

// Short suffix used to avoid overwriting an existing file
std::string generate_suffix();

} // namespace security
