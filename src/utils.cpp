#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace schsync {

std::string fmt(double val) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << val;
    std::string s = oss.str();
    // Trim trailing zeros after decimal point
    if (s.find('.') != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero != std::string::npos && s[last_nonzero] == '.') {
            s.erase(last_nonzero); // remove the dot too
        } else {
            s.erase(last_nonzero + 1);
        }
    }
    // Avoid "-0"
    if (s == "-0") s = "0";
    return s;
}

static std::string format_uuid(uint64_t a, uint64_t b) {
    char buf[40];
    std::snprintf(buf, sizeof(buf),
        "%08x-%04x-%04x-%04x-%012llx",
        (unsigned)(a >> 32),
        (unsigned)((a >> 16) & 0xFFFF),
        (unsigned)(a & 0x0FFF) | 0x4000,  // version 4
        (unsigned)((b >> 48) & 0x3FFF) | 0x8000, // variant
        (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string generate_uuid_from_seed(const std::string& seed) {
    uint64_t h1 = stable_hash(seed);
    uint64_t h2 = stable_hash(seed + "_2");
    return format_uuid(h1, h2);
}

std::uint64_t stable_hash(const std::string& data) {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_power_net(const std::string& net_name) {
    if (net_name.empty()) return false;
    std::string upper = net_name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    // Ground variants
    if (upper == "GND" || upper == "PGND" || upper == "AGND" || upper == "DGND" ||
        upper == "VSS" || upper == "GNDD" || upper == "GNDA") return true;

    // Positive supply variants
    if (upper == "VCC" || upper == "VDD" || upper == "VBUS") return true;

    // +NV patterns: +5V, +3V3, +3.3V, +12V, +1V8, etc.
    if (net_name[0] == '+' && net_name.size() >= 2) return true;

    return false;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace schsync
