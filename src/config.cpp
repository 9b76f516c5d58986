#include "config.h"
#include "fs.h"

#include <nlohmann/json.hpp>

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace peerlink {

namespace {

template <typename T>
void overlay(const nlohmann::json& j, const char* key, T& field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

bool validate_config(const PeerlinkConfig& config) {
    if (config.chunk_size == 0) {
        LOG_CONFIG_ERROR("chunk_size must be greater than 0");
        return false;
    }
    if (config.max_file_size == 0) {
        LOG_CONFIG_ERROR("max_file_size must be greater than 0");
        return false;
    }
    if (config.connect_timeout_ms <= 0 || config.stall_timeout_ms <= 0 ||
        config.heartbeat_interval_ms <= 0 || config.peer_heartbeat_interval_ms <= 0 ||
        config.peer_heartbeat_timeout_ms <= 0) {
        LOG_CONFIG_ERROR("Timeouts and intervals must be greater than 0");
        return false;
    }
    if (config.yield_interval_ms < 0 || config.auto_reply_delay_ms < 0) {
        LOG_CONFIG_ERROR("Delays must not be negative");
        return false;
    }
    if (config.buffer_capacity == 0) {
        LOG_CONFIG_ERROR("buffer_capacity must be greater than 0");
        return false;
    }
    if (config.max_participants < 2) {
        LOG_CONFIG_ERROR("max_participants must be at least 2");
        return false;
    }
    if (config.listen_port < 0 || config.listen_port > 65535) {
        LOG_CONFIG_ERROR("Invalid listen_port: " << config.listen_port);
        return false;
    }
    return true;
}

bool load_config(const std::string& path, PeerlinkConfig& out) {
    out = PeerlinkConfig();

    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No configuration file at " << path << ", using defaults");
        return true;
    }

    std::string data;
    if (!read_file_text(path, data)) {
        return false;
    }

    try {
        nlohmann::json config = nlohmann::json::parse(data);
        if (!config.is_object()) {
            LOG_CONFIG_ERROR("Configuration root must be an object: " << path);
            return false;
        }

        if (config.contains("log_level")) {
            std::string level = config.at("log_level").get<std::string>();
            if (!Logger::parse_log_level(level, out.log_level)) {
                LOG_CONFIG_ERROR("Unknown log_level: " << level);
                return false;
            }
        }

        overlay(config, "chunk_size", out.chunk_size);
        overlay(config, "max_file_size", out.max_file_size);
        overlay(config, "connect_timeout_ms", out.connect_timeout_ms);
        overlay(config, "stall_timeout_ms", out.stall_timeout_ms);
        overlay(config, "yield_interval_ms", out.yield_interval_ms);
        overlay(config, "buffer_capacity", out.buffer_capacity);
        overlay(config, "max_participants", out.max_participants);
        overlay(config, "heartbeat_interval_ms", out.heartbeat_interval_ms);
        overlay(config, "peer_heartbeat_interval_ms", out.peer_heartbeat_interval_ms);
        overlay(config, "peer_heartbeat_timeout_ms", out.peer_heartbeat_timeout_ms);
        overlay(config, "auto_reply_delay_ms", out.auto_reply_delay_ms);
        overlay(config, "listen_port", out.listen_port);
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file " << path << ": " << e.what());
        return false;
    }

    if (!validate_config(out)) {
        return false;
    }

    LOG_CONFIG_INFO("Loaded configuration from " << path);
    return true;
}

bool save_config(const std::string& path, const PeerlinkConfig& config) {
    nlohmann::json j;
    j["log_level"] = log_level_name(config.log_level);
    j["chunk_size"] = config.chunk_size;
    j["max_file_size"] = config.max_file_size;
    j["connect_timeout_ms"] = config.connect_timeout_ms;
    j["stall_timeout_ms"] = config.stall_timeout_ms;
    j["yield_interval_ms"] = config.yield_interval_ms;
    j["buffer_capacity"] = config.buffer_capacity;
    j["max_participants"] = config.max_participants;
    j["heartbeat_interval_ms"] = config.heartbeat_interval_ms;
    j["peer_heartbeat_interval_ms"] = config.peer_heartbeat_interval_ms;
    j["peer_heartbeat_timeout_ms"] = config.peer_heartbeat_timeout_ms;
    j["auto_reply_delay_ms"] = config.auto_reply_delay_ms;
    j["listen_port"] = config.listen_port;

    if (!create_file(path, j.dump(4))) {
        LOG_CONFIG_ERROR("Failed to save configuration to " << path);
        return false;
    }
    LOG_CONFIG_INFO("Saved configuration to " << path);
    return true;
}

} // namespace peerlink
