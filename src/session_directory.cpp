#include "session_directory.h"
#include "logger.h"
#include "sha256.h"
#include "util.h"

#include <algorithm>
#include <unordered_set>

#define LOG_DIRECTORY_DEBUG(message) LOG_DEBUG("directory", message)
#define LOG_DIRECTORY_INFO(message)  LOG_INFO("directory", message)
#define LOG_DIRECTORY_WARN(message)  LOG_WARN("directory", message)

namespace peerlink {

namespace {

const char kShortSlugChars[] = "0123456789abcdefghijklmnopqrstuvwxyz";
const size_t kShortSlugLength = 6;
const size_t kLongSlugWords = 4;

const char* const kSlugWords[] = {
    "angel", "brave", "charm", "dream", "ember", "frost", "grace", "heart",
    "ivory", "jewel", "karma", "lunar", "magic", "noble", "ocean", "pearl",
    "quest", "raven", "solar", "tiger", "unity", "velvet", "whisper", "zenith",
    "aura", "blaze", "crystal", "divine", "echo", "flame", "glimmer", "haven",
    "iris", "jade", "knight", "lotus", "mist", "nova", "opal", "prism",
    "quartz", "rose", "spark", "twilight", "umbra", "violet", "wonder", "spirit",
};

std::string hash_password(const std::string& password) {
    return SHA256::hash("peerlink-directory:" + password);
}

} // anonymous namespace

const char* join_rejection_to_string(JoinRejection rejection) {
    switch (rejection) {
        case JoinRejection::NONE:         return "none";
        case JoinRejection::FULL:         return "full";
        case JoinRejection::BAD_PASSWORD: return "bad-password";
        case JoinRejection::NOT_FOUND:    return "not-found";
        case JoinRejection::ALREADY_JOINED: return "already-joined";
    }
    return "unknown";
}

std::string generate_short_slug(std::mt19937& rng) {
    std::uniform_int_distribution<size_t> pick(0, sizeof(kShortSlugChars) - 2);
    std::string slug;
    slug.reserve(kShortSlugLength);
    for (size_t i = 0; i < kShortSlugLength; ++i) {
        slug += kShortSlugChars[pick(rng)];
    }
    return slug;
}

std::string generate_long_slug(std::mt19937& rng) {
    const size_t word_count = sizeof(kSlugWords) / sizeof(kSlugWords[0]);
    std::uniform_int_distribution<size_t> pick(0, word_count - 1);
    std::unordered_set<size_t> used;
    std::string slug;
    while (used.size() < kLongSlugWords) {
        size_t index = pick(rng);
        if (!used.insert(index).second) {
            continue;
        }
        if (!slug.empty()) slug += '-';
        slug += kSlugWords[index];
    }
    return slug;
}

LocalSessionDirectory::LocalSessionDirectory(Clock clock, int64_t ttl_ms)
    : clock_(clock ? std::move(clock) : Clock(now_ms)), ttl_ms_(ttl_ms), rng_(std::random_device{}()) {
}

std::optional<CreatedSession> LocalSessionDirectory::create_session(const std::string& host_peer_id,
                                                                    const CharacterInfo& character,
                                                                    int max_participants,
                                                                    const std::optional<std::string>& password,
                                                                    SlugStyle style) {
    purge_expired();
    if (host_peer_id.empty() || max_participants < 1) {
        LOG_DIRECTORY_WARN("Rejecting session with host '" << host_peer_id << "' and capacity " << max_participants);
        return std::nullopt;
    }

    std::string slug;
    for (int attempt = 0; attempt < kMaxSlugAttempts; ++attempt) {
        std::string candidate = next_slug(style);
        if (sessions_.find(candidate) == sessions_.end()) {
            slug = candidate;
            break;
        }
        LOG_DIRECTORY_DEBUG("Slug " << candidate << " taken, retrying");
    }
    if (slug.empty()) {
        LOG_DIRECTORY_WARN("No free slug after " << kMaxSlugAttempts << " attempts");
        return std::nullopt;
    }

    Entry entry;
    entry.roster.session_id = generate_uuid();
    entry.roster.slug = slug;
    entry.roster.host_peer_id = host_peer_id;
    entry.roster.participants.push_back(DirectoryParticipant{host_peer_id, character});
    entry.roster.max_participants = max_participants;
    entry.roster.password_protected = password && !password->empty();
    entry.roster.expires_at = clock_() + ttl_ms_;
    if (entry.roster.password_protected) {
        entry.password_hash = hash_password(*password);
    }

    CreatedSession created{entry.roster.session_id, slug, host_peer_id};
    sessions_.emplace(slug, std::move(entry));
    LOG_DIRECTORY_INFO("Created session " << slug << " for host " << host_peer_id);
    return created;
}

std::optional<SessionRoster> LocalSessionDirectory::get_session(const std::string& slug) {
    purge_expired();
    auto it = sessions_.find(slug);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.roster;
}

JoinResult LocalSessionDirectory::join_session(const std::string& slug, const std::string& peer_id,
                                               const CharacterInfo& character,
                                               const std::optional<std::string>& password) {
    purge_expired();
    JoinResult result;

    auto it = sessions_.find(slug);
    if (it == sessions_.end()) {
        result.rejection = JoinRejection::NOT_FOUND;
        LOG_DIRECTORY_INFO("Join of " << slug << " by " << peer_id << " rejected: not-found");
        return result;
    }
    Entry& entry = it->second;

    if (!entry.password_hash.empty()) {
        if (!password || !constant_time_equals(hash_password(*password), entry.password_hash)) {
            result.rejection = JoinRejection::BAD_PASSWORD;
            LOG_DIRECTORY_INFO("Join of " << slug << " by " << peer_id << " rejected: bad-password");
            return result;
        }
    }

    auto& participants = entry.roster.participants;
    auto existing = std::find_if(participants.begin(), participants.end(),
        [&peer_id](const DirectoryParticipant& p) { return p.peer_id == peer_id; });
    if (existing != participants.end()) {
        existing->character = character;
    } else {
        if (static_cast<int>(participants.size()) >= entry.roster.max_participants) {
            result.rejection = JoinRejection::FULL;
            LOG_DIRECTORY_INFO("Join of " << slug << " by " << peer_id << " rejected: full");
            return result;
        }
        participants.push_back(DirectoryParticipant{peer_id, character});
    }

    result.session_id = entry.roster.session_id;
    result.host_peer_id = entry.roster.host_peer_id;
    LOG_DIRECTORY_INFO(peer_id << " joined " << slug << " (" << participants.size() << "/"
                       << entry.roster.max_participants << ")");
    return result;
}

bool LocalSessionDirectory::heartbeat(const std::string& slug) {
    purge_expired();
    auto it = sessions_.find(slug);
    if (it == sessions_.end()) {
        LOG_DIRECTORY_WARN("Heartbeat for unknown session " << slug);
        return false;
    }
    it->second.roster.expires_at = clock_() + ttl_ms_;
    return true;
}

bool LocalSessionDirectory::destroy_session(const std::string& slug, const std::string& host_peer_id) {
    purge_expired();
    auto it = sessions_.find(slug);
    if (it == sessions_.end()) {
        return false;
    }
    if (it->second.roster.host_peer_id != host_peer_id) {
        LOG_DIRECTORY_WARN(host_peer_id << " may not destroy session " << slug);
        return false;
    }
    sessions_.erase(it);
    LOG_DIRECTORY_INFO("Destroyed session " << slug);
    return true;
}

size_t LocalSessionDirectory::session_count() {
    purge_expired();
    return sessions_.size();
}

void LocalSessionDirectory::purge_expired() {
    int64_t now = clock_();
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.roster.expires_at <= now) {
            LOG_DIRECTORY_INFO("Session " << it->first << " expired");
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

std::string LocalSessionDirectory::next_slug(SlugStyle style) {
    if (slug_generator_) {
        return slug_generator_(style);
    }
    return style == SlugStyle::LONG ? generate_long_slug(rng_) : generate_short_slug(rng_);
}

} // namespace peerlink
