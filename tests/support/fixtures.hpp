#pragma once

#include "core/history.hpp"
#include "crypto/keys.hpp"
#include "network/channel.hpp"
#include "network/sync_engine.hpp"
#include "server/history_service.hpp"
#include "server/loopback_channel.hpp"
#include "server/session_store.hpp"
#include "server/sqlite_record_storage.hpp"
#include "storage/database.hpp"
#include "storage/history_repository.hpp"
#include "storage/sync_state_repository.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spool::test {

/**
 * Key derived once from a fixed phrase. Argon2id is slow enough that
 * tests share it.
 */
const crypto::SyncKey& shared_key();

storage::Database open_local_db();
storage::Database open_server_db();

/**
 * In-process server: schema, storage, sessions and the HTTP handler.
 */
struct TestServer {
    TestServer();

    TestServer(const TestServer&) = delete;
    TestServer& operator=(const TestServer&) = delete;

    /**
     * Channel authenticated as `account` through a fresh session.
     */
    std::unique_ptr<server::LoopbackChannel> connect(const std::string& account = "alice");

    storage::Database db;
    server::SqliteRecordStorage storage;
    server::SessionStore sessions;
    server::HistoryService service;
};

/**
 * One machine: its own database, host id and repositories.
 */
struct TestClient {
    TestClient();

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    /**
     * Append a command run `offset_ms` milliseconds after the client's
     * base time, returning the stored record.
     */
    HistoryRecord run(const std::string& command, int offset_ms = 0);

    int64_t live_count();
    int64_t total_count();

    storage::Database db;
    Uuid host_id;
    Timestamp base;
    storage::HistoryRepository history;
    storage::SyncStateRepository state;
};

/**
 * Wraps a channel and lets a test intercept requests. When the hook
 * returns a value that value is the answer and the inner channel is not
 * called.
 */
class FaultyChannel : public network::HttpChannel {
public:
    using Hook = std::function<std::optional<Result<network::HttpResponse, Error>>(
        const network::HttpRequest&, int call)>;

    explicit FaultyChannel(network::HttpChannel& inner) : inner_(inner) {}

    void set_hook(Hook hook) { hook_ = std::move(hook); }

    [[nodiscard]] Result<network::HttpResponse, Error> send(
        const network::HttpRequest& request) override;

    [[nodiscard]] int calls() const { return calls_; }
    [[nodiscard]] int posts() const { return posts_; }

    network::HttpChannel& inner() { return inner_; }

private:
    network::HttpChannel& inner_;
    Hook hook_;
    int calls_ = 0;
    int posts_ = 0;
};

Result<network::HttpResponse, Error> transport_error(const std::string& message = "connection reset");
Result<network::HttpResponse, Error> http_status(int status, const std::string& message = "");

/**
 * Run cycles on every engine, in order, `rounds` times. Fails the test
 * on any error.
 */
void sync_all(const std::vector<network::SyncEngine*>& engines, int rounds = 2);

/**
 * Every record in the store, deleted ones included, sorted by id.
 */
std::vector<HistoryRecord> snapshot(storage::Database& db);

} // namespace spool::test
