#pragma once

#include <string>
#include <cstdint>

namespace peerlink {

/**
 * Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 lowercase form.
 * Used for challenges, chat item ids and session ids.
 */
std::string generate_uuid();

/**
 * Wall clock in milliseconds since the Unix epoch (chat timestamps).
 */
int64_t now_ms();

/**
 * Compare two strings without short-circuiting on the first difference.
 */
bool constant_time_equals(const std::string& a, const std::string& b);

} // namespace peerlink
