#pragma once

/**
 * @file mesh_messages.h
 * @brief Records exchanged over mesh chat connections
 *
 * Wire shape: one JSON object per text frame, "type" selects the variant,
 * fields are camelCase. Only a character's display name and avatar are
 * ever sent to other participants.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace peerlink {

struct CharacterInfo {
    std::string name;
    std::optional<std::string> avatar;

    bool operator==(const CharacterInfo& other) const {
        return name == other.name && avatar == other.avatar;
    }
};

struct ChatMessage {
    std::string id;
    std::string sender_id;
    std::string character_name;
    std::string content;
    bool is_human = true;
    int64_t timestamp = 0;
};

enum class SystemEvent {
    JOINED,
    LEFT
};

struct SystemMessage {
    std::string id;
    SystemEvent event = SystemEvent::JOINED;
    std::string character_name;
    int64_t timestamp = 0;
};

using ChatItem = std::variant<ChatMessage, SystemMessage>;

const std::string& chat_item_id(const ChatItem& item);
int64_t chat_item_timestamp(const ChatItem& item);

struct ParticipantInfo {
    std::string peer_id;
    CharacterInfo character;
    bool auto_reply_enabled = false;
};

namespace mesh {

struct CharacterSync {
    CharacterInfo character;
    std::string peer_id;
};

struct Typing {
    std::string peer_id;
    std::string character_name;
    bool is_typing = false;
};

struct Thinking {
    std::string peer_id;
    std::optional<std::string> character_name;
    bool is_thinking = false;
};

struct PeerState {
    std::string peer_id;
    bool auto_reply_enabled = false;
};

struct PeerConnecting {
    std::string peer_id;
};

struct ParticipantList {
    std::vector<ParticipantInfo> participants;
};

struct SessionInfo {
    std::vector<ParticipantInfo> participants;
    std::vector<ChatMessage> chat_history;
};

struct RequestSync {
    std::string peer_id;
};

struct PeerLeft {
    std::string peer_id;
    std::optional<std::string> character_name;
};

struct Heartbeat {
    std::string peer_id;
    int64_t timestamp = 0;
};

} // namespace mesh

using MeshMessage = std::variant<
    mesh::CharacterSync,
    ChatMessage,
    SystemMessage,
    mesh::Typing,
    mesh::Thinking,
    mesh::PeerState,
    mesh::PeerConnecting,
    mesh::ParticipantList,
    mesh::SessionInfo,
    mesh::RequestSync,
    mesh::PeerLeft,
    mesh::Heartbeat>;

std::string encode_mesh_message(const MeshMessage& message);

// std::nullopt (logged) for anything that is not a well-formed record
std::optional<MeshMessage> decode_mesh_message(const std::string& text);

const char* mesh_message_type(const MeshMessage& message);

} // namespace peerlink
