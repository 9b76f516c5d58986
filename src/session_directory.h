#pragma once

/**
 * @file session_directory.h
 * @brief Rendezvous directory for mesh chat sessions
 *
 * The directory only hands out slugs and the host's peer id so that guests
 * can find the host. It never sees chat payloads.
 */

#include "mesh_messages.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace peerlink {

enum class SlugStyle {
    SHORT,  // 6 chars of [0-9a-z]
    LONG    // 4 distinct words joined by '-'
};

enum class JoinRejection {
    NONE,
    FULL,
    BAD_PASSWORD,
    NOT_FOUND,
    ALREADY_JOINED      // caller is already in a session; the directory was not asked
};

const char* join_rejection_to_string(JoinRejection rejection);

struct CreatedSession {
    std::string session_id;
    std::string slug;
    std::string host_peer_id;
};

struct DirectoryParticipant {
    std::string peer_id;
    CharacterInfo character;
};

struct SessionRoster {
    std::string session_id;
    std::string slug;
    std::string host_peer_id;
    std::vector<DirectoryParticipant> participants;
    int max_participants = 0;
    bool password_protected = false;
    int64_t expires_at = 0;
};

struct JoinResult {
    JoinRejection rejection = JoinRejection::NONE;
    std::string session_id;
    std::string host_peer_id;

    bool accepted() const { return rejection == JoinRejection::NONE; }
};

class SessionDirectory {
public:
    virtual ~SessionDirectory() = default;

    // nullopt if no free slug could be allocated
    virtual std::optional<CreatedSession> create_session(const std::string& host_peer_id,
                                                         const CharacterInfo& character,
                                                         int max_participants,
                                                         const std::optional<std::string>& password,
                                                         SlugStyle style) = 0;

    virtual std::optional<SessionRoster> get_session(const std::string& slug) = 0;

    virtual JoinResult join_session(const std::string& slug, const std::string& peer_id,
                                    const CharacterInfo& character,
                                    const std::optional<std::string>& password) = 0;

    // Renew the session TTL; false if the session is gone
    virtual bool heartbeat(const std::string& slug) = 0;

    // Only the host may destroy its session
    virtual bool destroy_session(const std::string& slug, const std::string& host_peer_id) = 0;
};

std::string generate_short_slug(std::mt19937& rng);
std::string generate_long_slug(std::mt19937& rng);

/**
 * In-memory directory with TTL expiry, capacity and password checks.
 *
 * Time comes from an injectable clock (milliseconds); expired sessions are
 * purged lazily on every call.
 */
class LocalSessionDirectory : public SessionDirectory {
public:
    using Clock = std::function<int64_t()>;
    using SlugGenerator = std::function<std::string(SlugStyle style)>;

    static constexpr int64_t kSessionTtlMs = 4LL * 60 * 60 * 1000;
    static constexpr int kMaxSlugAttempts = 8;

    explicit LocalSessionDirectory(Clock clock = nullptr, int64_t ttl_ms = kSessionTtlMs);

    std::optional<CreatedSession> create_session(const std::string& host_peer_id,
                                                 const CharacterInfo& character,
                                                 int max_participants,
                                                 const std::optional<std::string>& password,
                                                 SlugStyle style) override;
    std::optional<SessionRoster> get_session(const std::string& slug) override;
    JoinResult join_session(const std::string& slug, const std::string& peer_id,
                            const CharacterInfo& character,
                            const std::optional<std::string>& password) override;
    bool heartbeat(const std::string& slug) override;
    bool destroy_session(const std::string& slug, const std::string& host_peer_id) override;

    size_t session_count();

    // Replaces the random slug source
    void set_slug_generator(SlugGenerator generator) { slug_generator_ = std::move(generator); }

private:
    struct Entry {
        SessionRoster roster;
        std::string password_hash;  // empty when unprotected
    };

    void purge_expired();
    std::string next_slug(SlugStyle style);

    Clock clock_;
    int64_t ttl_ms_;
    std::mt19937 rng_;
    SlugGenerator slug_generator_;
    std::map<std::string, Entry> sessions_;
};

} // namespace peerlink
