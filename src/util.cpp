#include "util.h"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

namespace peerlink {

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << static_cast<uint32_t>(hi >> 32) << '-';
    ss << std::setw(4) << static_cast<uint32_t>((hi >> 16) & 0xFFFF) << '-';
    ss << std::setw(4) << static_cast<uint32_t>(hi & 0xFFFF) << '-';
    ss << std::setw(4) << static_cast<uint32_t>(lo >> 48) << '-';
    ss << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // namespace peerlink
