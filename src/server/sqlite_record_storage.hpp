#pragma once

#include "server/record_storage.hpp"
#include "storage/database.hpp"
#include <mutex>

namespace spool::server {

/**
 * SqliteRecordStorage - RecordStorage over the server schema
 * (storage::SERVER_MIGRATIONS).
 *
 * Each account has a row in `accounts` holding its next sequence
 * number; inserts read and bump it inside an IMMEDIATE transaction.
 * Erasure deletes the envelopes but never the `accounts` row.
 * A mutex serialises use of the shared connection.
 */
class SqliteRecordStorage : public RecordStorage {
public:
    explicit SqliteRecordStorage(storage::Database& db) : db_(db) {}

    [[nodiscard]] Result<UpsertOutcome, Error> upsert(const std::string& account_id,
                                                      const Envelope& envelope) override;

    [[nodiscard]] Result<int64_t, Error> upsert_batch(
        const std::string& account_id,
        const std::vector<Envelope>& batch) override;

    [[nodiscard]] Result<EnvelopePage, Error> page_since(const std::string& account_id,
                                                         int64_t since,
                                                         int64_t limit) override;

    [[nodiscard]] Result<int64_t, Error> count(const std::string& account_id) override;

    [[nodiscard]] Result<LogBounds, Error> log_bounds(const std::string& account_id) override;

    [[nodiscard]] Result<void, Error> delete_account_data(const std::string& account_id) override;

    [[nodiscard]] Result<std::vector<HostStats>, Error> host_index(
        const std::string& account_id) override;

private:
    storage::Database& db_;
    std::mutex mutex_;

    // Caller holds mutex_ and an open transaction.
    [[nodiscard]] Result<UpsertOutcome, Error> insert_locked(const std::string& account_id,
                                                             const Envelope& envelope);
    [[nodiscard]] Result<void, Error> ensure_account(const std::string& account_id);
};

} // namespace spool::server
