#include <gtest/gtest.h>
#include "auth.h"
#include "sha256.h"

#include <set>

using namespace peerlink;

TEST(AuthTest, ChallengesAreFresh) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string challenge = generate_challenge();
        EXPECT_EQ(challenge.size(), 36u);
        EXPECT_TRUE(seen.insert(challenge).second);
    }
}

TEST(AuthTest, ResponseIsHashOfPasswordAndChallenge) {
    std::string response = compute_challenge_response("hunter2", "c1");
    EXPECT_EQ(response, SHA256::hash("hunter2c1"));
    EXPECT_EQ(response.size(), 64u);
}

TEST(AuthTest, VerifyAcceptsMatchingPassword) {
    std::string challenge = generate_challenge();
    std::string response = compute_challenge_response("hunter2", challenge);
    EXPECT_TRUE(verify_challenge_response("hunter2", challenge, response));
}

TEST(AuthTest, VerifyRejectsWrongPassword) {
    std::string challenge = generate_challenge();
    std::string response = compute_challenge_response("wrong", challenge);
    EXPECT_FALSE(verify_challenge_response("hunter2", challenge, response));
}

TEST(AuthTest, ResponseIsBoundToChallenge) {
    std::string response = compute_challenge_response("hunter2", "c1");
    EXPECT_FALSE(verify_challenge_response("hunter2", "c2", response));
    EXPECT_FALSE(verify_challenge_response("hunter2", "c1", ""));
}
