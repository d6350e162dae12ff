#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace spool::server {

/**
 * SessionStore - Bearer sessions for the history service.
 *
 * Only a BLAKE2b hash of each token is kept, so a dump of the store
 * cannot be replayed as credentials.
 */
class SessionStore {
public:
    /**
     * Open a session for `account_id` and return its token. The token is
     * shown once; it cannot be recovered from the store.
     */
    [[nodiscard]] std::string create_session(const std::string& account_id);

    /**
     * Account owning `token`, if the session is live.
     */
    [[nodiscard]] std::optional<std::string> resolve(std::string_view token) const;

    /**
     * End one session. Returns false when the token was not live.
     */
    bool revoke(std::string_view token);

    /**
     * End every session of an account (logout everywhere, key rotation,
     * account deletion). Returns how many were ended.
     */
    size_t revoke_all(const std::string& account_id);

    [[nodiscard]] size_t size() const;

private:
    struct Session {
        std::string account_id;
        Timestamp created_at;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;   // keyed by token hash
};

} // namespace spool::server
