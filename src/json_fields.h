#pragma once

// Typed field readers for validating decoded wire records, and the matching
// writer. Each reader returns false when the key is missing or has the wrong type.

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace peerlink {
namespace json_fields {

// Compact wire text. Invalid UTF-8 inside strings is written as U+FFFD
// instead of throwing type_error.316.
inline std::string dump_wire(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline bool is_valid_utf8(const std::string& text) {
    try {
        nlohmann::json(text).dump();
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
    return true;
}

inline bool read_string(const nlohmann::json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Absent or null is accepted and leaves out empty
inline bool read_optional_string(const nlohmann::json& object, const char* key, std::optional<std::string>& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        out.reset();
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

inline bool read_bool(const nlohmann::json& object, const char* key, bool& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return false;
    }
    out = it->get<bool>();
    return true;
}

inline bool read_u64(const nlohmann::json& object, const char* key, uint64_t& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return false;
    }
    if (it->is_number_unsigned()) {
        out = it->get<uint64_t>();
        return true;
    }
    if (it->is_number_integer()) {
        int64_t value = it->get<int64_t>();
        if (value < 0) return false;
        out = static_cast<uint64_t>(value);
        return true;
    }
    return false;
}

inline bool read_i64(const nlohmann::json& object, const char* key, int64_t& out) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

} // namespace json_fields
} // namespace peerlink
