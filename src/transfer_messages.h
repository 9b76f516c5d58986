#pragma once

/**
 * @file transfer_messages.h
 * @brief Control records of the file transfer protocol
 *
 * Every record travels as one text frame holding a JSON object whose
 * "type" field names the variant. Chunk payloads travel as binary frames,
 * each followed by the Chunk record that commits it.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace peerlink {

struct FileInfo {
    std::string name;
    uint64_t size = 0;
    std::string type;
};

namespace transfer {

// downloader -> uploader
struct RequestInfo {
    std::optional<std::string> browser_name;
    std::optional<std::string> os_name;
};

// uploader -> downloader
struct PasswordRequired {
    std::string challenge;
    std::optional<std::string> error;
};

// downloader -> uploader, response = hex(SHA-256(password + challenge))
struct UsePassword {
    std::string response;
};

struct Info {
    FileInfo file;
};

struct Start {
    uint64_t offset = 0;
};

struct Chunk {
    uint64_t offset = 0;
    bool final = false;
};

struct ChunkAck {
    uint64_t bytes_received = 0;
};

struct Pause {};
struct Done {};

// either direction
struct Error {
    std::string message;
};

} // namespace transfer

using TransferMessage = std::variant<
    transfer::RequestInfo,
    transfer::PasswordRequired,
    transfer::UsePassword,
    transfer::Info,
    transfer::Start,
    transfer::Chunk,
    transfer::ChunkAck,
    transfer::Pause,
    transfer::Done,
    transfer::Error>;

std::string encode_transfer_message(const TransferMessage& message);

/**
 * @brief Parse and validate one text frame
 * @return std::nullopt for malformed JSON, an unknown type or a missing or
 *         mistyped field (the reason is logged)
 */
std::optional<TransferMessage> decode_transfer_message(const std::string& text);

// Wire name of the variant ("RequestInfo", "Chunk", ...)
const char* transfer_message_type(const TransferMessage& message);

} // namespace peerlink
