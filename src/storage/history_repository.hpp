#pragma once

#include "storage/database.hpp"
#include "core/history.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace spool::storage {

/**
 * A row waiting in the push queue, tagged with its queue position.
 */
struct LocalChange {
    int64_t change_seq{0};
    HistoryRecord record;
};

enum class MergeOutcome {
    Inserted,     // new live record
    Tombstoned,   // inserted as, or turned into, a tombstone
    Unchanged     // already known; nothing to do
};

/**
 * HistoryRepository - The local record store.
 *
 * Owns the plaintext history on this machine. Records are keyed by id;
 * content never changes after insert and the only update is the
 * one-way transition to a tombstone.
 */
class HistoryRepository {
public:
    explicit HistoryRepository(Database& db) : db_(db) {}

    /**
     * Insert a record created on this host and queue it for push.
     * DuplicateId if the id is already present.
     */
    [[nodiscard]] Result<void, Error> append(const HistoryRecord& record);

    /**
     * Tombstone a record and queue the tombstone for push. NotFound for
     * unknown ids; a record that is already deleted is left as is.
     */
    [[nodiscard]] Result<void, Error> mark_deleted(const Uuid& id, Timestamp at);

    /**
     * Queued rows with change_seq > marker, oldest first.
     */
    [[nodiscard]] Result<std::vector<LocalChange>, Error> records_since(int64_t marker,
                                                                       size_t limit);

    /**
     * Apply a record that arrived from sync.
     *
     * Unknown ids are inserted. For known ids a tombstone always wins over
     * live data and the later of two deletion times is kept. A live copy
     * never resurrects a deleted record. Merged rows are not queued.
     */
    [[nodiscard]] Result<MergeOutcome, Error> merge_remote(const HistoryRecord& record);

    [[nodiscard]] Result<std::optional<HistoryRecord>, Error> get(const Uuid& id);

    [[nodiscard]] Result<int64_t, Error> count(bool include_deleted = false);

    /**
     * Live records, most recent first.
     */
    [[nodiscard]] Result<std::vector<HistoryRecord>, Error> list(size_t limit, size_t offset = 0);

    /**
     * Number of queued rows past `marker`.
     */
    [[nodiscard]] Result<int64_t, Error> pending_count(int64_t marker);

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> insert(const HistoryRecord& record, bool queue);
    [[nodiscard]] Result<void, Error> set_deleted(const Uuid& id, Timestamp at, bool queue);
    [[nodiscard]] static HistoryRecord row_to_record(Statement& stmt);
};

} // namespace spool::storage
