#include "auth.h"
#include "sha256.h"
#include "util.h"

namespace peerlink {

std::string generate_challenge() {
    return generate_uuid();
}

std::string compute_challenge_response(const std::string& password, const std::string& challenge) {
    SHA256 hasher;
    hasher.update(password);
    hasher.update(challenge);
    return hasher.finalize();
}

bool verify_challenge_response(const std::string& password, const std::string& challenge,
                               const std::string& response) {
    if (challenge.empty()) {
        return false;
    }
    return constant_time_equals(compute_challenge_response(password, challenge), response);
}

} // namespace peerlink
