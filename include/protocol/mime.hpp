#pragma once

#include <string>
#include <filesystem>

namespace protocol {

// Content-Type from the file extension, "application/octet-stream" when unknown
std::string guess_content_type(const std::filesystem::path& path);

} // namespace protocol
