#pragma once

#include "logger.h"

#include <cstdint>
#include <string>

namespace peerlink {

/**
 * Tunables shared by every peerlink component. Every key of the JSON file
 * is optional; missing keys keep the defaults below.
 */
struct PeerlinkConfig {
    LogLevel log_level = LogLevel::INFO;

    // transfer
    size_t chunk_size = 256 * 1024;
    uint64_t max_file_size = 2ULL * 1024 * 1024 * 1024;
    int64_t connect_timeout_ms = 30000;
    int64_t stall_timeout_ms = 60000;
    int64_t yield_interval_ms = 0;

    // mesh session
    size_t buffer_capacity = 100;
    int max_participants = 8;
    int64_t heartbeat_interval_ms = 60000;        ///< directory heartbeat
    int64_t peer_heartbeat_interval_ms = 10000;   ///< guest -> host liveness
    int64_t peer_heartbeat_timeout_ms = 30000;
    int64_t auto_reply_delay_ms = 5000;

    int listen_port = 0;
};

/**
 * @brief Load configuration from a JSON file
 *
 * out is reset to defaults first. A missing file is not an error.
 * @return false on unreadable or malformed files and on invalid values
 */
bool load_config(const std::string& path, PeerlinkConfig& out);

bool save_config(const std::string& path, const PeerlinkConfig& config);

// Checks value ranges; logs the first violation
bool validate_config(const PeerlinkConfig& config);

const char* log_level_name(LogLevel level);

} // namespace peerlink
