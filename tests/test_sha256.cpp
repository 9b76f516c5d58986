#include <gtest/gtest.h>
#include "sha256.h"

#include <string>

using namespace peerlink;

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(SHA256::hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, ShortInput) {
    EXPECT_EQ(SHA256::hash("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockInput) {
    EXPECT_EQ(SHA256::hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionA) {
    SHA256 hasher;
    std::string block(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.update(block);
    }
    EXPECT_EQ(hasher.finalize(), "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    const std::string input = "The quick brown fox jumps over the lazy dog";
    SHA256 hasher;
    for (char c : input) {
        hasher.update(static_cast<uint8_t>(c));
    }
    EXPECT_EQ(hasher.finalize(), SHA256::hash(input));
    EXPECT_EQ(SHA256::hash(input), "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}
