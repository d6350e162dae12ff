#include "server/session_store.hpp"

#include "crypto/keys.hpp"

namespace spool::server {

namespace {

constexpr size_t TOKEN_BYTES = 32;

} // namespace

std::string SessionStore::create_session(const std::string& account_id) {
    const auto token = crypto::to_hex(crypto::random_bytes(TOKEN_BYTES));

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[crypto::hash_hex(token)] = Session{account_id, Timestamp::now()};
    return token;
}

std::optional<std::string> SessionStore::resolve(std::string_view token) const {
    if (token.empty()) {
        return std::nullopt;
    }
    const auto key = crypto::hash_hex(token);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.account_id;
}

bool SessionStore::revoke(std::string_view token) {
    const auto key = crypto::hash_hex(token);

    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(key) > 0;
}

size_t SessionStore::revoke_all(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.account_id == account_id) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace spool::server
