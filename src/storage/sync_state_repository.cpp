#include "storage/sync_state_repository.hpp"

#include "core/types.hpp"

namespace spool::storage {

namespace {

constexpr const char* PULL_CURSOR_KEY = "pull_cursor";
constexpr const char* LAST_PUSHED_KEY = "last_pushed";

} // namespace

Result<int64_t, Error> SyncStateRepository::read(const std::string& scope, const char* key) {
    auto stmt_result = db_.prepare("SELECT value FROM sync_state WHERE scope = ? AND key = ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, scope).bind_text(2, key);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(step_result.unwrap() ? stmt.column_int64(0) : 0);
}

Result<void, Error> SyncStateRepository::write(const std::string& scope, const char* key,
                                               int64_t value) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO sync_state (scope, key, value, updated_at) VALUES (?, ?, ?, ?)
        ON CONFLICT(scope, key) DO UPDATE SET
            value = excluded.value,
            updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, scope)
        .bind_text(2, key)
        .bind_int64(3, value)
        .bind_int64(4, Timestamp::now().nanos());
    return stmt.run();
}

Result<int64_t, Error> SyncStateRepository::pull_cursor(const std::string& scope) {
    return read(scope, PULL_CURSOR_KEY);
}

Result<void, Error> SyncStateRepository::set_pull_cursor(const std::string& scope,
                                                         int64_t global_seq) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto current = read(scope, PULL_CURSOR_KEY);
        if (current.is_err()) {
            return Result<void, Error>::err(current.unwrap_err());
        }
        if (global_seq < current.unwrap()) {
            return fail(ErrorCode::SyncCursorInvalid,
                "Pull cursor for " + scope + " would move back from " +
                std::to_string(current.unwrap()) + " to " + std::to_string(global_seq));
        }
        return write(scope, PULL_CURSOR_KEY, global_seq);
    }, TransactionMode::Immediate);
}

Result<void, Error> SyncStateRepository::reset_pull_cursor(const std::string& scope) {
    return write(scope, PULL_CURSOR_KEY, 0);
}

Result<int64_t, Error> SyncStateRepository::last_pushed(const std::string& scope) {
    return read(scope, LAST_PUSHED_KEY);
}

Result<void, Error> SyncStateRepository::set_last_pushed(const std::string& scope,
                                                         int64_t change_seq) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto current = read(scope, LAST_PUSHED_KEY);
        if (current.is_err()) {
            return Result<void, Error>::err(current.unwrap_err());
        }
        if (change_seq <= current.unwrap()) {
            return Result<void, Error>::ok();
        }
        return write(scope, LAST_PUSHED_KEY, change_seq);
    }, TransactionMode::Immediate);
}

Result<void, Error> SyncStateRepository::reset_last_pushed(const std::string& scope) {
    return write(scope, LAST_PUSHED_KEY, 0);
}

} // namespace spool::storage
