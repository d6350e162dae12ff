#pragma once

#include "core/envelope.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace spool::server {

enum class UpsertOutcome {
    Inserted,
    AlreadyPresent
};

struct EnvelopePage {
    std::vector<Envelope> records;  // ascending global_seq
    bool has_more{false};
};

/**
 * Per-host totals, keyed by the opaque host token.
 */
struct HostStats {
    std::string host_token;
    int64_t count{0};
    int64_t last_seq{0};
};

/**
 * Where an account's log stands. Without an erasure count == max_seq.
 */
struct LogBounds {
    int64_t count{0};           // envelopes currently stored
    int64_t max_seq{0};         // highest global_seq ever assigned
    int64_t erased_through{0};  // highest global_seq removed by an erasure
};

/**
 * RecordStorage - Durable per-account ciphertext log.
 *
 * Contract for every implementation:
 * - upsert inserts an envelope id the account has not seen and assigns
 *   it the account's next global_seq; a known id is a no-op and
 *   consumes no sequence number.
 * - global_seq values of an account start at 1 and are never reused,
 *   not even after delete_account_data. Above erased_through there are
 *   no gaps.
 * - page_since observes a consistent snapshot.
 * - Accounts share no state.
 */
class RecordStorage {
public:
    virtual ~RecordStorage() = default;

    [[nodiscard]] virtual Result<UpsertOutcome, Error> upsert(const std::string& account_id,
                                                              const Envelope& envelope) = 0;

    /**
     * Upsert a whole batch atomically. Returns how many envelopes were new.
     * On error nothing from the batch is stored.
     */
    [[nodiscard]] virtual Result<int64_t, Error> upsert_batch(
        const std::string& account_id,
        const std::vector<Envelope>& batch) = 0;

    /**
     * Envelopes with global_seq > since, at most `limit` of them.
     */
    [[nodiscard]] virtual Result<EnvelopePage, Error> page_since(const std::string& account_id,
                                                                 int64_t since,
                                                                 int64_t limit) = 0;

    [[nodiscard]] virtual Result<int64_t, Error> count(const std::string& account_id) = 0;

    [[nodiscard]] virtual Result<LogBounds, Error> log_bounds(const std::string& account_id) = 0;

    /**
     * Erase every envelope of the account. The allocator survives and
     * erased_through moves up to the last assigned global_seq, so cursors
     * issued before the erasure can be told apart from later ones.
     */
    [[nodiscard]] virtual Result<void, Error> delete_account_data(const std::string& account_id) = 0;

    [[nodiscard]] virtual Result<std::vector<HostStats>, Error> host_index(
        const std::string& account_id) = 0;
};

} // namespace spool::server
