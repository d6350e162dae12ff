#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <string>

namespace spool::storage {

/**
 * SyncStateRepository - Durable client sync markers.
 *
 * Two independent markers per scope (one scope per server account):
 * the pull cursor is the highest global_seq merged locally, the push
 * marker is the highest local change_seq the server acknowledged.
 */
class SyncStateRepository {
public:
    explicit SyncStateRepository(Database& db) : db_(db) {}

    /**
     * 0 when nothing has been pulled yet.
     */
    [[nodiscard]] Result<int64_t, Error> pull_cursor(const std::string& scope);

    /**
     * Advance the pull cursor. Moving it backwards is SyncCursorInvalid;
     * use reset_pull_cursor() for an intentional full resync.
     */
    [[nodiscard]] Result<void, Error> set_pull_cursor(const std::string& scope, int64_t global_seq);

    [[nodiscard]] Result<void, Error> reset_pull_cursor(const std::string& scope);

    [[nodiscard]] Result<int64_t, Error> last_pushed(const std::string& scope);

    /**
     * Record the push acknowledgement. Never moves the marker backwards.
     */
    [[nodiscard]] Result<void, Error> set_last_pushed(const std::string& scope, int64_t change_seq);

    /**
     * Forget every acknowledgement so the whole local queue is pushed
     * again. Only safe because upserts are idempotent.
     */
    [[nodiscard]] Result<void, Error> reset_last_pushed(const std::string& scope);

private:
    Database& db_;

    [[nodiscard]] Result<int64_t, Error> read(const std::string& scope, const char* key);
    [[nodiscard]] Result<void, Error> write(const std::string& scope, const char* key,
                                            int64_t value);
};

} // namespace spool::storage
