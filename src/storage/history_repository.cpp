#include "storage/history_repository.hpp"

namespace spool::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT id, host_id, timestamp, duration, exit_code, command, cwd,
           session, deleted_at, change_seq
    FROM history
)SQL";

std::string select_where(const char* tail) {
    return std::string(SELECT_COLUMNS) + tail;
}

} // namespace

HistoryRecord HistoryRepository::row_to_record(Statement& stmt) {
    HistoryRecord record{
        .id = Uuid::parse(stmt.column_text(0)).value_or(Uuid{}),
        .host_id = Uuid::parse(stmt.column_text(1)).value_or(Uuid{}),
        .timestamp = Timestamp(stmt.column_int64(2)),
        .duration = stmt.column_int64(3),
        .exit_code = stmt.column_int64(4),
        .command = stmt.column_text(5),
        .cwd = stmt.column_text(6),
        .session = stmt.column_text(7),
        .deleted_at = std::nullopt
    };
    if (!stmt.column_is_null(8)) {
        record.deleted_at = Timestamp(stmt.column_int64(8));
    }
    return record;
}

Result<void, Error> HistoryRepository::insert(const HistoryRecord& record, bool queue) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO history (id, host_id, timestamp, duration, exit_code,
                             command, cwd, session, deleted_at, change_seq)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?,
                CASE WHEN ? THEN (SELECT COALESCE(MAX(change_seq), 0) + 1 FROM history)
                     ELSE NULL END);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, record.id.to_string())
        .bind_text(2, record.host_id.to_string())
        .bind_int64(3, record.timestamp.nanos())
        .bind_int64(4, record.duration)
        .bind_int64(5, record.exit_code)
        .bind_text(6, record.command)
        .bind_text(7, record.cwd)
        .bind_text(8, record.session);
    if (record.deleted_at) {
        stmt.bind_int64(9, record.deleted_at->nanos());
    } else {
        stmt.bind_null(9);
    }
    stmt.bind_int64(10, queue ? 1 : 0);

    auto run_result = stmt.run();
    if (run_result.is_err() && run_result.unwrap_err().code == ErrorCode::DuplicateId) {
        return fail(ErrorCode::DuplicateId, "Record " + record.id.to_string() + " already exists");
    }
    return run_result;
}

Result<void, Error> HistoryRepository::set_deleted(const Uuid& id, Timestamp at, bool queue) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE history
        SET command = '', cwd = '', deleted_at = ?,
            change_seq = CASE WHEN ? THEN (SELECT COALESCE(MAX(change_seq), 0) + 1 FROM history)
                              ELSE change_seq END
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, at.nanos())
        .bind_int64(2, queue ? 1 : 0)
        .bind_text(3, id.to_string());
    return stmt.run();
}

Result<void, Error> HistoryRepository::append(const HistoryRecord& record) {
    return insert(record, true);
}

Result<void, Error> HistoryRepository::mark_deleted(const Uuid& id, Timestamp at) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto existing = get(id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        if (!existing.unwrap()) {
            return fail(ErrorCode::NotFound, "No history record " + id.to_string());
        }
        if (existing.unwrap()->is_deleted()) {
            return Result<void, Error>::ok();
        }
        return set_deleted(id, at, true);
    }, TransactionMode::Immediate);
}

Result<std::vector<LocalChange>, Error> HistoryRepository::records_since(int64_t marker,
                                                                        size_t limit) {
    std::vector<LocalChange> changes;

    auto stmt_result = db_.prepare(select_where(
        "WHERE change_seq > ? ORDER BY change_seq LIMIT ?;"));
    if (stmt_result.is_err()) {
        return Result<std::vector<LocalChange>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, marker)
        .bind_int64(2, static_cast<int64_t>(limit));

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<LocalChange>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        changes.push_back(LocalChange{
            .change_seq = stmt.column_int64(9),
            .record = row_to_record(stmt)
        });
    }

    return Result<std::vector<LocalChange>, Error>::ok(std::move(changes));
}

Result<MergeOutcome, Error> HistoryRepository::merge_remote(const HistoryRecord& record) {
    return db_.transaction([&]() -> Result<MergeOutcome, Error> {
        auto existing_result = get(record.id);
        if (existing_result.is_err()) {
            return Result<MergeOutcome, Error>::err(existing_result.unwrap_err());
        }
        const auto& existing = existing_result.unwrap();

        if (!existing) {
            auto inserted = insert(record, false);
            if (inserted.is_err()) {
                return Result<MergeOutcome, Error>::err(inserted.unwrap_err());
            }
            return Result<MergeOutcome, Error>::ok(
                record.is_deleted() ? MergeOutcome::Tombstoned : MergeOutcome::Inserted);
        }

        if (!record.is_deleted()) {
            return Result<MergeOutcome, Error>::ok(MergeOutcome::Unchanged);
        }

        // Both deleted: the later deletion time is the one every replica keeps.
        if (existing->is_deleted() && *existing->deleted_at >= *record.deleted_at) {
            return Result<MergeOutcome, Error>::ok(MergeOutcome::Unchanged);
        }

        auto updated = set_deleted(record.id, *record.deleted_at, false);
        if (updated.is_err()) {
            return Result<MergeOutcome, Error>::err(updated.unwrap_err());
        }
        return Result<MergeOutcome, Error>::ok(MergeOutcome::Tombstoned);
    }, TransactionMode::Immediate);
}

Result<std::optional<HistoryRecord>, Error> HistoryRepository::get(const Uuid& id) {
    auto stmt_result = db_.prepare(select_where("WHERE id = ?;"));
    if (stmt_result.is_err()) {
        return Result<std::optional<HistoryRecord>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, id.to_string());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<HistoryRecord>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<HistoryRecord>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<HistoryRecord>, Error>::ok(row_to_record(stmt));
}

Result<int64_t, Error> HistoryRepository::count(bool include_deleted) {
    auto stmt_result = db_.prepare(include_deleted
        ? "SELECT COUNT(*) FROM history;"
        : "SELECT COUNT(*) FROM history WHERE deleted_at IS NULL;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<std::vector<HistoryRecord>, Error> HistoryRepository::list(size_t limit, size_t offset) {
    std::vector<HistoryRecord> records;

    auto stmt_result = db_.prepare(select_where(
        "WHERE deleted_at IS NULL ORDER BY timestamp DESC, id LIMIT ? OFFSET ?;"));
    if (stmt_result.is_err()) {
        return Result<std::vector<HistoryRecord>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, static_cast<int64_t>(limit))
        .bind_int64(2, static_cast<int64_t>(offset));

    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<HistoryRecord>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        records.push_back(row_to_record(stmt));
    }

    return Result<std::vector<HistoryRecord>, Error>::ok(std::move(records));
}

Result<int64_t, Error> HistoryRepository::pending_count(int64_t marker) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM history WHERE change_seq > ?;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, marker);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace spool::storage
