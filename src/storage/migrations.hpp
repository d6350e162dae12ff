#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace spool::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * Client schema: the local history log and the sync markers.
 *
 * change_seq is the push queue position. Locally created rows and local
 * deletions take the next value; rows merged from the server keep NULL
 * and are never pushed back.
 */
inline const std::vector<Migration> LOCAL_MIGRATIONS = {
    {
        .version = 1,
        .name = "history",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS history (
                id TEXT PRIMARY KEY,
                host_id TEXT NOT NULL,
                timestamp INTEGER NOT NULL,
                duration INTEGER NOT NULL DEFAULT 0,
                exit_code INTEGER NOT NULL DEFAULT 0,
                command TEXT NOT NULL,
                cwd TEXT NOT NULL,
                session TEXT NOT NULL,
                deleted_at INTEGER,
                change_seq INTEGER UNIQUE
            );
            CREATE INDEX IF NOT EXISTS idx_history_timestamp ON history(timestamp);
            CREATE INDEX IF NOT EXISTS idx_history_host ON history(host_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS history;
        )SQL"
    },
    {
        .version = 2,
        .name = "sync_state",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS sync_state (
                scope TEXT NOT NULL,
                key TEXT NOT NULL,
                value INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                PRIMARY KEY (scope, key)
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_state;
        )SQL"
    }
};

/**
 * Server schema: one ordered ciphertext log per account plus the
 * per-account sequence allocator.
 */
inline const std::vector<Migration> SERVER_MIGRATIONS = {
    {
        .version = 1,
        .name = "envelopes",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS accounts (
                account_id TEXT PRIMARY KEY,
                next_seq INTEGER NOT NULL DEFAULT 1
            );

            CREATE TABLE IF NOT EXISTS envelopes (
                account_id TEXT NOT NULL REFERENCES accounts(account_id) ON DELETE CASCADE,
                envelope_id TEXT NOT NULL,
                host_token TEXT NOT NULL,
                ciphertext BLOB NOT NULL,
                nonce BLOB NOT NULL,
                version INTEGER NOT NULL,
                global_seq INTEGER NOT NULL,
                created_at INTEGER NOT NULL,
                PRIMARY KEY (account_id, envelope_id),
                UNIQUE (account_id, global_seq)
            );
            CREATE INDEX IF NOT EXISTS idx_envelopes_host ON envelopes(account_id, host_token);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS envelopes;
            DROP TABLE IF EXISTS accounts;
        )SQL"
    },
    {
        // Erasing an account keeps its allocator; sequence numbers up to
        // erased_through are gone for good and are never handed out again.
        .version = 2,
        .name = "account_erasure",
        .up_sql = R"SQL(
            ALTER TABLE accounts ADD COLUMN erased_through INTEGER NOT NULL DEFAULT 0;
        )SQL",
        .down_sql = R"SQL(
            ALTER TABLE accounts DROP COLUMN erased_through;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs a list of migrations against a database.
 */
class MigrationRunner {
public:
    MigrationRunner(Database& db, const std::vector<Migration>& migrations)
        : db_(db), migrations_(migrations) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Rollback the last migration.
     */
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] int latest_version() const {
        return migrations_.empty() ? 0 : migrations_.back().version;
    }

private:
    Database& db_;
    const std::vector<Migration>& migrations_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Bring a client database up to the latest local schema.
 */
[[nodiscard]] inline Result<void, Error> initialize_local_database(Database& db) {
    MigrationRunner runner(db, LOCAL_MIGRATIONS);
    return runner.migrate();
}

/**
 * Bring a server database up to the latest server schema.
 */
[[nodiscard]] inline Result<void, Error> initialize_server_database(Database& db) {
    MigrationRunner runner(db, SERVER_MIGRATIONS);
    return runner.migrate();
}

} // namespace spool::storage
