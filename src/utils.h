#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace schsync {

// Format a double for reports (6 decimal places, trailing zeros trimmed)
std::string fmt(double val);

// Generate a UUID string (v4 layout, deterministic from seed)
std::string generate_uuid_from_seed(const std::string& seed);

// 64-bit FNV-1a. Stable across runs and platforms, unlike std::hash.
std::uint64_t stable_hash(const std::string& data);

// Trim whitespace
std::string trim(const std::string& s);

// Supply and ground nets that the schematic connects through global power symbols
bool is_power_net(const std::string& net_name);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace schsync
