#include "sha256.h"
#include <iomanip>
#include <sstream>
#include <cstring>

namespace peerlink {

// Round constants: first 32 bits of the fractional parts of the cube roots of the first 64 primes
static const uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static uint32_t right_rotate(uint32_t value, int amount) {
    return (value >> amount) | (value << (32 - amount));
}

SHA256::SHA256() {
    reset();
}

void SHA256::reset() {
    state_[0] = 0x6a09e667;
    state_[1] = 0xbb67ae85;
    state_[2] = 0x3c6ef372;
    state_[3] = 0xa54ff53a;
    state_[4] = 0x510e527f;
    state_[5] = 0x9b05688c;
    state_[6] = 0x1f83d9ab;
    state_[7] = 0x5be0cd19;

    buffer_length_ = 0;
    total_length_ = 0;
    finalized_ = false;
}

void SHA256::update(uint8_t byte) {
    if (finalized_) {
        return;
    }

    buffer_[buffer_length_++] = byte;
    total_length_++;

    if (buffer_length_ == 64) {
        process_block();
        buffer_length_ = 0;
    }
}

void SHA256::update(const uint8_t* data, size_t length) {
    for (size_t i = 0; i < length; i++) {
        update(data[i]);
    }
}

void SHA256::update(const std::string& str) {
    update(reinterpret_cast<const uint8_t*>(str.data()), str.length());
}

void SHA256::process_block() {
    uint32_t w[64];

    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<uint32_t>(buffer_[i * 4]) << 24) |
               (static_cast<uint32_t>(buffer_[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(buffer_[i * 4 + 2]) << 8) |
               (static_cast<uint32_t>(buffer_[i * 4 + 3]));
    }

    for (int i = 16; i < 64; i++) {
        uint32_t s0 = right_rotate(w[i - 15], 7) ^ right_rotate(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = right_rotate(w[i - 2], 17) ^ right_rotate(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];
    uint32_t e = state_[4];
    uint32_t f = state_[5];
    uint32_t g = state_[6];
    uint32_t h = state_[7];

    for (int i = 0; i < 64; i++) {
        uint32_t S1 = right_rotate(e, 6) ^ right_rotate(e, 11) ^ right_rotate(e, 25);
        uint32_t ch = (e & f) ^ (~e & g);
        uint32_t temp1 = h + S1 + ch + K[i] + w[i];
        uint32_t S0 = right_rotate(a, 2) ^ right_rotate(a, 13) ^ right_rotate(a, 22);
        uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
        uint32_t temp2 = S0 + maj;

        h = g;
        g = f;
        f = e;
        e = d + temp1;
        d = c;
        c = b;
        b = a;
        a = temp1 + temp2;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
    state_[5] += f;
    state_[6] += g;
    state_[7] += h;
}

std::string SHA256::finalize() {
    if (!finalized_) {
        uint64_t bit_length = total_length_ * 8;

        update(0x80);
        while (buffer_length_ != 56) {
            update(0x00);
        }
        for (int i = 7; i >= 0; i--) {
            update(static_cast<uint8_t>(bit_length >> (i * 8)));
        }

        finalized_ = true;
    }

    std::ostringstream result;
    result << std::hex << std::setfill('0');
    for (int i = 0; i < 8; i++) {
        result << std::setw(8) << state_[i];
    }
    return result.str();
}

std::string SHA256::hash(const std::string& input) {
    SHA256 hasher;
    hasher.update(input);
    return hasher.finalize();
}

} // namespace peerlink
