#include "mesh_messages.h"
#include "json_fields.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#define LOG_MESH_WARN(message) LOG_WARN("mesh", message)

namespace peerlink {

using nlohmann::json;
using namespace json_fields;

const std::string& chat_item_id(const ChatItem& item) {
    if (const auto* chat = std::get_if<ChatMessage>(&item)) {
        return chat->id;
    }
    return std::get<SystemMessage>(item).id;
}

int64_t chat_item_timestamp(const ChatItem& item) {
    if (const auto* chat = std::get_if<ChatMessage>(&item)) {
        return chat->timestamp;
    }
    return std::get<SystemMessage>(item).timestamp;
}

namespace {

json character_to_json(const CharacterInfo& character) {
    json j = {{"name", character.name}};
    if (character.avatar) j["avatar"] = *character.avatar;
    return j;
}

// Extra character fields are ignored; only name and avatar are kept
bool character_from_json(const json& j, CharacterInfo& out) {
    return j.is_object() && read_string(j, "name", out.name) && read_optional_string(j, "avatar", out.avatar);
}

json chat_fields(const ChatMessage& m) {
    return {{"id", m.id},
            {"senderId", m.sender_id},
            {"characterName", m.character_name},
            {"content", m.content},
            {"isHuman", m.is_human},
            {"timestamp", m.timestamp}};
}

bool chat_from_json(const json& j, ChatMessage& out) {
    return j.is_object() && read_string(j, "id", out.id) && !out.id.empty() &&
           read_string(j, "senderId", out.sender_id) &&
           read_string(j, "characterName", out.character_name) &&
           read_string(j, "content", out.content) &&
           read_bool(j, "isHuman", out.is_human) &&
           read_i64(j, "timestamp", out.timestamp);
}

json participants_to_json(const std::vector<ParticipantInfo>& participants) {
    json list = json::array();
    for (const auto& p : participants) {
        list.push_back({{"peerId", p.peer_id},
                        {"character", character_to_json(p.character)},
                        {"autoReplyEnabled", p.auto_reply_enabled}});
    }
    return list;
}

bool participants_from_json(const json& j, const char* key, std::vector<ParticipantInfo>& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return false;
    }
    for (const auto& entry : *it) {
        ParticipantInfo p;
        auto character = entry.find("character");
        if (!entry.is_object() || !read_string(entry, "peerId", p.peer_id) || p.peer_id.empty() ||
            character == entry.end() || !character_from_json(*character, p.character) ||
            !read_bool(entry, "autoReplyEnabled", p.auto_reply_enabled)) {
            return false;
        }
        out.push_back(std::move(p));
    }
    return true;
}

struct MeshEncoder {
    json operator()(const mesh::CharacterSync& m) const {
        return {{"type", "CharacterSync"}, {"character", character_to_json(m.character)}, {"peerId", m.peer_id}};
    }
    json operator()(const ChatMessage& m) const {
        json j = chat_fields(m);
        j["type"] = "ChatMessage";
        return j;
    }
    json operator()(const SystemMessage& m) const {
        return {{"type", "SystemMessage"},
                {"id", m.id},
                {"event", m.event == SystemEvent::JOINED ? "joined" : "left"},
                {"characterName", m.character_name},
                {"timestamp", m.timestamp}};
    }
    json operator()(const mesh::Typing& m) const {
        return {{"type", "Typing"}, {"peerId", m.peer_id}, {"characterName", m.character_name},
                {"isTyping", m.is_typing}};
    }
    json operator()(const mesh::Thinking& m) const {
        json j = {{"type", "Thinking"}, {"peerId", m.peer_id}, {"isThinking", m.is_thinking}};
        if (m.character_name) j["characterName"] = *m.character_name;
        return j;
    }
    json operator()(const mesh::PeerState& m) const {
        return {{"type", "PeerState"}, {"peerId", m.peer_id}, {"autoReplyEnabled", m.auto_reply_enabled}};
    }
    json operator()(const mesh::PeerConnecting& m) const {
        return {{"type", "PeerConnecting"}, {"peerId", m.peer_id}};
    }
    json operator()(const mesh::ParticipantList& m) const {
        return {{"type", "ParticipantList"}, {"participants", participants_to_json(m.participants)}};
    }
    json operator()(const mesh::SessionInfo& m) const {
        json history = json::array();
        for (const auto& chat : m.chat_history) {
            history.push_back(chat_fields(chat));
        }
        return {{"type", "SessionInfo"},
                {"participants", participants_to_json(m.participants)},
                {"chatHistory", history}};
    }
    json operator()(const mesh::RequestSync& m) const {
        return {{"type", "RequestSync"}, {"peerId", m.peer_id}};
    }
    json operator()(const mesh::PeerLeft& m) const {
        json j = {{"type", "PeerLeft"}, {"peerId", m.peer_id}};
        if (m.character_name) j["characterName"] = *m.character_name;
        return j;
    }
    json operator()(const mesh::Heartbeat& m) const {
        return {{"type", "Heartbeat"}, {"peerId", m.peer_id}, {"timestamp", m.timestamp}};
    }
};

struct MeshTypeName {
    const char* operator()(const mesh::CharacterSync&) const { return "CharacterSync"; }
    const char* operator()(const ChatMessage&) const { return "ChatMessage"; }
    const char* operator()(const SystemMessage&) const { return "SystemMessage"; }
    const char* operator()(const mesh::Typing&) const { return "Typing"; }
    const char* operator()(const mesh::Thinking&) const { return "Thinking"; }
    const char* operator()(const mesh::PeerState&) const { return "PeerState"; }
    const char* operator()(const mesh::PeerConnecting&) const { return "PeerConnecting"; }
    const char* operator()(const mesh::ParticipantList&) const { return "ParticipantList"; }
    const char* operator()(const mesh::SessionInfo&) const { return "SessionInfo"; }
    const char* operator()(const mesh::RequestSync&) const { return "RequestSync"; }
    const char* operator()(const mesh::PeerLeft&) const { return "PeerLeft"; }
    const char* operator()(const mesh::Heartbeat&) const { return "Heartbeat"; }
};

bool read_peer_id(const json& j, std::string& out) {
    return read_string(j, "peerId", out) && !out.empty();
}

std::optional<MeshMessage> decode_fields(const std::string& type, const json& j) {
    if (type == "CharacterSync") {
        mesh::CharacterSync m;
        auto character = j.find("character");
        if (character != j.end() && character_from_json(*character, m.character) && read_peer_id(j, m.peer_id)) {
            return MeshMessage(m);
        }
    } else if (type == "ChatMessage") {
        ChatMessage m;
        if (chat_from_json(j, m)) {
            return MeshMessage(m);
        }
    } else if (type == "SystemMessage") {
        SystemMessage m;
        std::string event;
        if (read_string(j, "id", m.id) && !m.id.empty() && read_string(j, "event", event) &&
            (event == "joined" || event == "left") &&
            read_string(j, "characterName", m.character_name) && read_i64(j, "timestamp", m.timestamp)) {
            m.event = event == "joined" ? SystemEvent::JOINED : SystemEvent::LEFT;
            return MeshMessage(m);
        }
    } else if (type == "Typing") {
        mesh::Typing m;
        if (read_peer_id(j, m.peer_id) && read_string(j, "characterName", m.character_name) &&
            read_bool(j, "isTyping", m.is_typing)) {
            return MeshMessage(m);
        }
    } else if (type == "Thinking") {
        mesh::Thinking m;
        if (read_peer_id(j, m.peer_id) && read_optional_string(j, "characterName", m.character_name) &&
            read_bool(j, "isThinking", m.is_thinking)) {
            return MeshMessage(m);
        }
    } else if (type == "PeerState") {
        mesh::PeerState m;
        if (read_peer_id(j, m.peer_id) && read_bool(j, "autoReplyEnabled", m.auto_reply_enabled)) {
            return MeshMessage(m);
        }
    } else if (type == "PeerConnecting") {
        mesh::PeerConnecting m;
        if (read_peer_id(j, m.peer_id)) {
            return MeshMessage(m);
        }
    } else if (type == "ParticipantList") {
        mesh::ParticipantList m;
        if (participants_from_json(j, "participants", m.participants)) {
            return MeshMessage(m);
        }
    } else if (type == "SessionInfo") {
        mesh::SessionInfo m;
        auto history = j.find("chatHistory");
        if (participants_from_json(j, "participants", m.participants) &&
            history != j.end() && history->is_array()) {
            bool valid = true;
            for (const auto& entry : *history) {
                ChatMessage chat;
                if (!chat_from_json(entry, chat)) {
                    valid = false;
                    break;
                }
                m.chat_history.push_back(std::move(chat));
            }
            if (valid) {
                return MeshMessage(m);
            }
        }
    } else if (type == "RequestSync") {
        mesh::RequestSync m;
        if (read_peer_id(j, m.peer_id)) {
            return MeshMessage(m);
        }
    } else if (type == "PeerLeft") {
        mesh::PeerLeft m;
        if (read_peer_id(j, m.peer_id) && read_optional_string(j, "characterName", m.character_name)) {
            return MeshMessage(m);
        }
    } else if (type == "Heartbeat") {
        mesh::Heartbeat m;
        if (read_peer_id(j, m.peer_id) && read_i64(j, "timestamp", m.timestamp)) {
            return MeshMessage(m);
        }
    } else {
        LOG_MESH_WARN("Unknown mesh record type: " << type);
        return std::nullopt;
    }

    LOG_MESH_WARN("Malformed " << type << " record");
    return std::nullopt;
}

} // namespace

std::string encode_mesh_message(const MeshMessage& message) {
    return dump_wire(std::visit(MeshEncoder{}, message));
}

std::optional<MeshMessage> decode_mesh_message(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        LOG_MESH_WARN("Dropping unparseable mesh record: " << e.what());
        return std::nullopt;
    }

    std::string type;
    if (!j.is_object() || !read_string(j, "type", type)) {
        LOG_MESH_WARN("Dropping mesh record without a type");
        return std::nullopt;
    }
    return decode_fields(type, j);
}

const char* mesh_message_type(const MeshMessage& message) {
    return std::visit(MeshTypeName{}, message);
}

} // namespace peerlink
