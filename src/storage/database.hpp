#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace spool::storage {

/**
 * SQLite statement wrapper with RAII.
 *
 * Step failures map to ErrorCode::DuplicateId for primary key / unique
 * violations and ErrorCode::IoFailure for everything else.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Statement& bind_text(int index, std::string_view text);
    Statement& bind_int64(int index, int64_t value);
    Statement& bind_blob(int index, const std::vector<uint8_t>& data);
    Statement& bind_null(int index);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Advance. Ok(true) when a row is available, Ok(false) when done.
     * A failed bind surfaces here so call sites check a single result.
     */
    [[nodiscard]] Result<bool, Error> step();

    /**
     * Step a statement that returns no rows.
     */
    [[nodiscard]] Result<void, Error> run();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
    int bind_error_ = SQLITE_OK;
};

enum class TransactionMode {
    Deferred,
    Immediate   // take the write lock up front
};

/**
 * Database - SQLite connection.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(std::string_view sql);

    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    [[nodiscard]] Result<void, Error> begin_transaction(
        TransactionMode mode = TransactionMode::Deferred);
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Run `f` inside a transaction. Commits when `f` returns ok, rolls
     * back otherwise. A failed rollback is folded into the returned error.
     * Inside an open transaction `f` simply joins it.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f, TransactionMode mode = TransactionMode::Deferred)
        -> decltype(f()) {
        using ResultType = decltype(f());

        if (in_transaction()) {
            return f();
        }

        auto begin_result = begin_transaction(mode);
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                return ResultType::err(Error{
                    result.unwrap_err().code,
                    result.unwrap_err().message + " (rollback also failed: " +
                        rollback_result.unwrap_err().message + ")"});
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto rollback_result = rollback();
            (void)rollback_result;  // the commit error takes precedence
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    [[nodiscard]] bool in_transaction() const {
        return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
    }

    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

/**
 * Transaction RAII guard. Rolls back unless committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db, TransactionMode mode = TransactionMode::Deferred);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    /**
     * Error from BEGIN, if it failed.
     */
    [[nodiscard]] const Result<void, Error>& status() const { return status_; }

    [[nodiscard]] Result<void, Error> commit();

private:
    Database& db_;
    Result<void, Error> status_;
    bool active_ = false;
};

} // namespace spool::storage
