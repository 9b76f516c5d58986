#pragma once

#include <string>

namespace peerlink {

/**
 * Challenge-response password check for protected transfers.
 *
 * The verifier sends a fresh random challenge; the prover answers with
 * hex(SHA-256(password + challenge)). The password itself never crosses
 * the wire.
 */

// Fresh random challenge (UUID v4 text)
std::string generate_challenge();

// hex(SHA-256(password || challenge)), 64 lowercase hex chars
std::string compute_challenge_response(const std::string& password, const std::string& challenge);

// Recompute and compare in constant time
bool verify_challenge_response(const std::string& password, const std::string& challenge,
                               const std::string& response);

} // namespace peerlink
