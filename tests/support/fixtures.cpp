#include "support/fixtures.hpp"

#include "network/protocol.hpp"
#include "storage/migrations.hpp"

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>

namespace spool::test {

const crypto::SyncKey& shared_key() {
    static const crypto::SyncKey key =
        crypto::derive_key("correct horse battery staple").unwrap();
    return key;
}

storage::Database open_local_db() {
    auto db = storage::Database::open_memory().unwrap();
    storage::initialize_local_database(db).unwrap();
    return db;
}

storage::Database open_server_db() {
    auto db = storage::Database::open_memory().unwrap();
    storage::initialize_server_database(db).unwrap();
    return db;
}

TestServer::TestServer()
    : db(open_server_db())
    , storage(db)
    , sessions()
    , service(storage, sessions)
{
}

std::unique_ptr<server::LoopbackChannel> TestServer::connect(const std::string& account) {
    return std::make_unique<server::LoopbackChannel>(service, sessions.create_session(account));
}

TestClient::TestClient()
    : db(open_local_db())
    , host_id(Uuid::generate())
    , base(Timestamp::now())
    , history(db)
    , state(db)
{
}

HistoryRecord TestClient::run(const std::string& command, int offset_ms) {
    auto record = make_record(host_id, base + std::chrono::milliseconds(offset_ms),
                              command, "/home/test", "session-1");
    REQUIRE(history.append(record).is_ok());
    return record;
}

int64_t TestClient::live_count() {
    return history.count().unwrap();
}

int64_t TestClient::total_count() {
    return history.count(true).unwrap();
}

Result<network::HttpResponse, Error> FaultyChannel::send(const network::HttpRequest& request) {
    const int call = calls_++;
    if (request.method == network::HttpMethod::Post) {
        ++posts_;
    }
    if (hook_) {
        auto injected = hook_(request, call);
        if (injected) {
            return std::move(*injected);
        }
    }
    return inner_.send(request);
}

Result<network::HttpResponse, Error> transport_error(const std::string& message) {
    return fail<network::HttpResponse>(ErrorCode::Transport, message);
}

Result<network::HttpResponse, Error> http_status(int status, const std::string& message) {
    return Result<network::HttpResponse, Error>::ok(network::HttpResponse{
        status, network::encode_error(QString::fromStdString(message))});
}

void sync_all(const std::vector<network::SyncEngine*>& engines, int rounds) {
    for (int round = 0; round < rounds; ++round) {
        for (auto* engine : engines) {
            auto report = engine->run_cycle();
            INFO("round " << round << ": "
                 << (report.is_err() ? report.unwrap_err().describe() : std::string("ok")));
            REQUIRE(report.is_ok());
        }
    }
}

std::vector<HistoryRecord> snapshot(storage::Database& db) {
    auto stmt = db.prepare("SELECT id FROM history ORDER BY id;").unwrap();
    std::vector<std::string> ids;
    while (stmt.step().unwrap()) {
        ids.push_back(stmt.column_text(0));
    }

    storage::HistoryRepository repo(db);
    std::vector<HistoryRecord> records;
    for (const auto& id : ids) {
        auto record = repo.get(*Uuid::parse(id)).unwrap();
        REQUIRE(record.has_value());
        records.push_back(*record);
    }
    return records;
}

} // namespace spool::test
