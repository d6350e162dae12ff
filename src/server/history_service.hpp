#pragma once

#include "network/channel.hpp"
#include "server/record_storage.hpp"
#include "server/session_store.hpp"

#include <optional>
#include <string>

namespace spool::server {

/**
 * HistoryService - The server side of the sync protocol.
 *
 * Routes:
 *   POST   /history          push a batch (all or nothing)
 *   GET    /history          page through envelopes after a global_seq
 *   GET    /history/count    number of envelopes in the account
 *   GET    /history/index    per-host counts and last global_seq
 *   DELETE /account          erase the account's log and end its sessions
 *
 * Every request needs "Authorization: Token <token>". Failures answer
 * with {"error": msg} and 400, 401, 404, 405, 413 or 500.
 */
class HistoryService {
public:
    HistoryService(RecordStorage& storage, SessionStore& sessions)
        : storage_(storage), sessions_(sessions) {}

    [[nodiscard]] network::HttpResponse handle(const network::HttpRequest& request);

private:
    RecordStorage& storage_;
    SessionStore& sessions_;

    [[nodiscard]] std::optional<std::string> authenticate(const network::HttpRequest& request) const;

    [[nodiscard]] network::HttpResponse push(const std::string& account_id,
                                             const network::HttpRequest& request);
    [[nodiscard]] network::HttpResponse pull(const std::string& account_id,
                                             const network::HttpRequest& request);
    [[nodiscard]] network::HttpResponse count(const std::string& account_id);
    [[nodiscard]] network::HttpResponse index(const std::string& account_id);
    [[nodiscard]] network::HttpResponse delete_account(const std::string& account_id);
};

} // namespace spool::server
