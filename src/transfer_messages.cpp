#include "transfer_messages.h"
#include "json_fields.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#define LOG_TRANSFER_WARN(message) LOG_WARN("transfer", message)

namespace peerlink {

using nlohmann::json;
using namespace json_fields;

namespace {

struct TransferEncoder {
    json operator()(const transfer::RequestInfo& m) const {
        json j = {{"type", "RequestInfo"}};
        if (m.browser_name) j["browserName"] = *m.browser_name;
        if (m.os_name) j["osName"] = *m.os_name;
        return j;
    }
    json operator()(const transfer::PasswordRequired& m) const {
        json j = {{"type", "PasswordRequired"}, {"challenge", m.challenge}};
        if (m.error) j["error"] = *m.error;
        return j;
    }
    json operator()(const transfer::UsePassword& m) const {
        return {{"type", "UsePassword"}, {"response", m.response}};
    }
    json operator()(const transfer::Info& m) const {
        return {{"type", "Info"},
                {"file", {{"name", m.file.name}, {"size", m.file.size}, {"type", m.file.type}}}};
    }
    json operator()(const transfer::Start& m) const {
        return {{"type", "Start"}, {"offset", m.offset}};
    }
    json operator()(const transfer::Chunk& m) const {
        return {{"type", "Chunk"}, {"offset", m.offset}, {"final", m.final}};
    }
    json operator()(const transfer::ChunkAck& m) const {
        return {{"type", "ChunkAck"}, {"bytesReceived", m.bytes_received}};
    }
    json operator()(const transfer::Pause&) const { return {{"type", "Pause"}}; }
    json operator()(const transfer::Done&) const { return {{"type", "Done"}}; }
    json operator()(const transfer::Error& m) const {
        return {{"type", "Error"}, {"message", m.message}};
    }
};

struct TransferTypeName {
    const char* operator()(const transfer::RequestInfo&) const { return "RequestInfo"; }
    const char* operator()(const transfer::PasswordRequired&) const { return "PasswordRequired"; }
    const char* operator()(const transfer::UsePassword&) const { return "UsePassword"; }
    const char* operator()(const transfer::Info&) const { return "Info"; }
    const char* operator()(const transfer::Start&) const { return "Start"; }
    const char* operator()(const transfer::Chunk&) const { return "Chunk"; }
    const char* operator()(const transfer::ChunkAck&) const { return "ChunkAck"; }
    const char* operator()(const transfer::Pause&) const { return "Pause"; }
    const char* operator()(const transfer::Done&) const { return "Done"; }
    const char* operator()(const transfer::Error&) const { return "Error"; }
};

std::optional<TransferMessage> decode_fields(const std::string& type, const json& j) {
    if (type == "RequestInfo") {
        transfer::RequestInfo m;
        if (read_optional_string(j, "browserName", m.browser_name) &&
            read_optional_string(j, "osName", m.os_name)) {
            return TransferMessage(m);
        }
    } else if (type == "PasswordRequired") {
        transfer::PasswordRequired m;
        if (read_string(j, "challenge", m.challenge) && !m.challenge.empty() &&
            read_optional_string(j, "error", m.error)) {
            return TransferMessage(m);
        }
    } else if (type == "UsePassword") {
        transfer::UsePassword m;
        if (read_string(j, "response", m.response)) {
            return TransferMessage(m);
        }
    } else if (type == "Info") {
        auto file = j.find("file");
        transfer::Info m;
        if (file != j.end() && file->is_object() &&
            read_string(*file, "name", m.file.name) &&
            read_u64(*file, "size", m.file.size) &&
            read_string(*file, "type", m.file.type)) {
            return TransferMessage(m);
        }
    } else if (type == "Start") {
        transfer::Start m;
        // offset defaults to 0 when omitted
        if (!j.contains("offset") || read_u64(j, "offset", m.offset)) {
            return TransferMessage(m);
        }
    } else if (type == "Chunk") {
        transfer::Chunk m;
        if (read_u64(j, "offset", m.offset) && read_bool(j, "final", m.final)) {
            return TransferMessage(m);
        }
    } else if (type == "ChunkAck") {
        transfer::ChunkAck m;
        if (read_u64(j, "bytesReceived", m.bytes_received)) {
            return TransferMessage(m);
        }
    } else if (type == "Pause") {
        return TransferMessage(transfer::Pause{});
    } else if (type == "Done") {
        return TransferMessage(transfer::Done{});
    } else if (type == "Error") {
        transfer::Error m;
        if (read_string(j, "message", m.message)) {
            return TransferMessage(m);
        }
    } else {
        LOG_TRANSFER_WARN("Unknown transfer record type: " << type);
        return std::nullopt;
    }

    LOG_TRANSFER_WARN("Malformed " << type << " record");
    return std::nullopt;
}

} // namespace

std::string encode_transfer_message(const TransferMessage& message) {
    return dump_wire(std::visit(TransferEncoder{}, message));
}

std::optional<TransferMessage> decode_transfer_message(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        LOG_TRANSFER_WARN("Dropping unparseable transfer record: " << e.what());
        return std::nullopt;
    }

    std::string type;
    if (!j.is_object() || !read_string(j, "type", type)) {
        LOG_TRANSFER_WARN("Dropping transfer record without a type");
        return std::nullopt;
    }
    return decode_fields(type, j);
}

const char* transfer_message_type(const TransferMessage& message) {
    return std::visit(TransferTypeName{}, message);
}

} // namespace peerlink
