#include "server/sqlite_record_storage.hpp"

#include "core/types.hpp"

namespace spool::server {

Result<void, Error> SqliteRecordStorage::ensure_account(const std::string& account_id) {
    auto stmt_result = db_.prepare(
        "INSERT INTO accounts (account_id, next_seq) VALUES (?, 1) "
        "ON CONFLICT(account_id) DO NOTHING;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, account_id);
    return stmt.run();
}

Result<UpsertOutcome, Error> SqliteRecordStorage::insert_locked(const std::string& account_id,
                                                                const Envelope& envelope) {
    auto existing_result = db_.prepare(
        "SELECT 1 FROM envelopes WHERE account_id = ? AND envelope_id = ?;");
    if (existing_result.is_err()) {
        return Result<UpsertOutcome, Error>::err(existing_result.unwrap_err());
    }
    auto existing = std::move(existing_result).unwrap();
    existing.bind_text(1, account_id).bind_text(2, envelope.id);
    auto found = existing.step();
    if (found.is_err()) {
        return Result<UpsertOutcome, Error>::err(found.unwrap_err());
    }
    if (found.unwrap()) {
        return Result<UpsertOutcome, Error>::ok(UpsertOutcome::AlreadyPresent);
    }

    auto ensured = ensure_account(account_id);
    if (ensured.is_err()) {
        return Result<UpsertOutcome, Error>::err(ensured.unwrap_err());
    }

    auto seq_result = db_.prepare("SELECT next_seq FROM accounts WHERE account_id = ?;");
    if (seq_result.is_err()) {
        return Result<UpsertOutcome, Error>::err(seq_result.unwrap_err());
    }
    auto seq_stmt = std::move(seq_result).unwrap();
    seq_stmt.bind_text(1, account_id);
    auto seq_row = seq_stmt.step();
    if (seq_row.is_err()) {
        return Result<UpsertOutcome, Error>::err(seq_row.unwrap_err());
    }
    if (!seq_row.unwrap()) {
        return fail<UpsertOutcome>(ErrorCode::IoFailure,
                                   "Sequence row for account " + account_id + " vanished");
    }
    const int64_t global_seq = seq_stmt.column_int64(0);

    auto insert_result = db_.prepare(R"SQL(
        INSERT INTO envelopes (account_id, envelope_id, host_token, ciphertext, nonce,
                               version, global_seq, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (insert_result.is_err()) {
        return Result<UpsertOutcome, Error>::err(insert_result.unwrap_err());
    }
    auto insert = std::move(insert_result).unwrap();
    insert.bind_text(1, account_id)
        .bind_text(2, envelope.id)
        .bind_text(3, envelope.host_token)
        .bind_blob(4, envelope.ciphertext)
        .bind_blob(5, envelope.nonce)
        .bind_int64(6, envelope.version)
        .bind_int64(7, global_seq)
        .bind_int64(8, Timestamp::now().nanos());
    auto inserted = insert.run();
    if (inserted.is_err()) {
        return Result<UpsertOutcome, Error>::err(inserted.unwrap_err());
    }

    auto bump_result = db_.prepare(
        "UPDATE accounts SET next_seq = next_seq + 1 WHERE account_id = ?;");
    if (bump_result.is_err()) {
        return Result<UpsertOutcome, Error>::err(bump_result.unwrap_err());
    }
    auto bump = std::move(bump_result).unwrap();
    bump.bind_text(1, account_id);
    auto bumped = bump.run();
    if (bumped.is_err()) {
        return Result<UpsertOutcome, Error>::err(bumped.unwrap_err());
    }

    return Result<UpsertOutcome, Error>::ok(UpsertOutcome::Inserted);
}

Result<UpsertOutcome, Error> SqliteRecordStorage::upsert(const std::string& account_id,
                                                         const Envelope& envelope) {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.transaction([&]() { return insert_locked(account_id, envelope); },
                           storage::TransactionMode::Immediate);
}

Result<int64_t, Error> SqliteRecordStorage::upsert_batch(const std::string& account_id,
                                                         const std::vector<Envelope>& batch) {
    std::lock_guard<std::mutex> lock(mutex_);

    storage::TransactionGuard tx(db_, storage::TransactionMode::Immediate);
    if (tx.status().is_err()) {
        return Result<int64_t, Error>::err(tx.status().unwrap_err());
    }

    int64_t inserted = 0;
    for (const auto& envelope : batch) {
        auto outcome = insert_locked(account_id, envelope);
        if (outcome.is_err()) {
            return Result<int64_t, Error>::err(outcome.unwrap_err());
        }
        if (outcome.unwrap() == UpsertOutcome::Inserted) {
            ++inserted;
        }
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
        return Result<int64_t, Error>::err(committed.unwrap_err());
    }
    return Result<int64_t, Error>::ok(inserted);
}

Result<EnvelopePage, Error> SqliteRecordStorage::page_since(const std::string& account_id,
                                                            int64_t since,
                                                            int64_t limit) {
    if (limit < 1) {
        return fail<EnvelopePage>(ErrorCode::MalformedPayload, "Page limit must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // One extra row tells whether another page follows.
    auto stmt_result = db_.prepare(R"SQL(
        SELECT envelope_id, host_token, ciphertext, nonce, version, global_seq
        FROM envelopes
        WHERE account_id = ? AND global_seq > ?
        ORDER BY global_seq
        LIMIT ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<EnvelopePage, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, account_id)
        .bind_int64(2, since)
        .bind_int64(3, limit + 1);

    EnvelopePage page;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<EnvelopePage, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        if (static_cast<int64_t>(page.records.size()) == limit) {
            page.has_more = true;
            break;
        }
        page.records.push_back(Envelope{
            .id = stmt.column_text(0),
            .host_token = stmt.column_text(1),
            .ciphertext = stmt.column_blob(2),
            .nonce = stmt.column_blob(3),
            .version = static_cast<uint32_t>(stmt.column_int64(4)),
            .global_seq = stmt.column_int64(5)
        });
    }

    return Result<EnvelopePage, Error>::ok(std::move(page));
}

Result<int64_t, Error> SqliteRecordStorage::count(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM envelopes WHERE account_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, account_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<LogBounds, Error> SqliteRecordStorage::log_bounds(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt_result = db_.prepare(R"SQL(
        SELECT
            (SELECT COUNT(*) FROM envelopes WHERE account_id = ?1),
            COALESCE((SELECT next_seq - 1 FROM accounts WHERE account_id = ?1), 0),
            COALESCE((SELECT erased_through FROM accounts WHERE account_id = ?1), 0);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<LogBounds, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, account_id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<LogBounds, Error>::err(step_result.unwrap_err());
    }
    return Result<LogBounds, Error>::ok(LogBounds{
        .count = stmt.column_int64(0),
        .max_seq = stmt.column_int64(1),
        .erased_through = stmt.column_int64(2)
    });
}

Result<void, Error> SqliteRecordStorage::delete_account_data(const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    return db_.transaction([&]() -> Result<void, Error> {
        auto envelopes = db_.prepare("DELETE FROM envelopes WHERE account_id = ?;");
        if (envelopes.is_err()) {
            return Result<void, Error>::err(envelopes.unwrap_err());
        }
        auto delete_envelopes = std::move(envelopes).unwrap();
        delete_envelopes.bind_text(1, account_id);
        auto removed = delete_envelopes.run();
        if (removed.is_err()) {
            return removed;
        }

        auto account = db_.prepare(
            "UPDATE accounts SET erased_through = next_seq - 1 WHERE account_id = ?;");
        if (account.is_err()) {
            return Result<void, Error>::err(account.unwrap_err());
        }
        auto mark_erased = std::move(account).unwrap();
        mark_erased.bind_text(1, account_id);
        return mark_erased.run();
    }, storage::TransactionMode::Immediate);
}

Result<std::vector<HostStats>, Error> SqliteRecordStorage::host_index(
    const std::string& account_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt_result = db_.prepare(R"SQL(
        SELECT host_token, COUNT(*), MAX(global_seq)
        FROM envelopes
        WHERE account_id = ?
        GROUP BY host_token
        ORDER BY host_token;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<HostStats>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, account_id);

    std::vector<HostStats> hosts;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<HostStats>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        hosts.push_back(HostStats{
            .host_token = stmt.column_text(0),
            .count = stmt.column_int64(1),
            .last_seq = stmt.column_int64(2)
        });
    }
    return Result<std::vector<HostStats>, Error>::ok(std::move(hosts));
}

} // namespace spool::server
