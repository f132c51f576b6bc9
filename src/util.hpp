#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace shellhost {

// Trim whitespace
std::string trim(const std::string& s);

// True if s begins with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Standard base64 (RFC 4648, padded)
std::string base64_encode(const std::vector<uint8_t>& bytes);

} // namespace shellhost
