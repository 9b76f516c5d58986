#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace peerlink {

class SHA256 {
public:
    SHA256();

    // Process a single byte
    void update(uint8_t byte);

    // Process a buffer
    void update(const uint8_t* data, size_t length);

    // Process a string
    void update(const std::string& str);

    // Get the final hash as a lowercase hex string (64 chars)
    std::string finalize();

    // Convenience function to hash a string directly
    static std::string hash(const std::string& input);

private:
    void process_block();
    void reset();

    uint32_t state_[8];
    uint8_t buffer_[64];
    size_t buffer_length_;
    uint64_t total_length_;
    bool finalized_;
};

} // namespace peerlink
