#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace parlay::engine {

inline uint64_t fnv1a64(const std::string &s) {
    uint64_t hash = 1469598103934665603ULL;
    constexpr uint64_t prime = 1099511628211ULL;
    for (unsigned char c : s) {
        hash ^= static_cast<uint64_t>(c);
        hash *= prime;
    }
    return hash;
}

inline std::string hex64(uint64_t value) {
    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << value;
    return ss.str();
}

// Order-insensitive fingerprint of a set of ids plus a context string.
// Ids are sorted and joined with '\x1f' so "a,b" and "ab" never collide.
inline std::string fingerprint_ids(std::vector<std::string> ids, const std::string &context) {
    std::sort(ids.begin(), ids.end());
    std::string payload = context;
    payload.push_back('\x1e');
    for (const auto &id : ids) {
        payload += id;
        payload.push_back('\x1f');
    }
    return "fnv1a64:" + hex64(fnv1a64(payload));
}

}  // namespace parlay::engine
