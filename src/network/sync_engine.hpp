#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/keys.hpp"
#include "network/channel.hpp"
#include "network/protocol.hpp"
#include "storage/database.hpp"
#include "storage/history_repository.hpp"
#include "storage/sync_state_repository.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace spool::network {

struct SyncOptions {
    std::string scope{"default"};   // marker namespace, one per server account
    size_t push_batch_size{100};
    int64_t page_size{DEFAULT_PAGE_SIZE};
};

/**
 * A record that could not be pushed or pulled. The cycle carries on.
 */
struct RecordFailure {
    std::string envelope_id;
    Error error;
};

struct SyncReport {
    int64_t pushed{0};      // envelopes acknowledged by the server
    int64_t pulled{0};      // envelopes received
    int64_t merged{0};      // pulled envelopes that changed the local store
    std::vector<RecordFailure> failures;

    [[nodiscard]] bool clean() const noexcept { return failures.empty(); }
};

/**
 * SyncEngine - Reconciles the local store with the server.
 *
 * A cycle is one push pass followed by one pull pass. Only one cycle
 * runs at a time; starting another while one is in flight fails with
 * ErrorCode::Busy. Progress is committed per batch (push) and per page
 * (pull), so an aborted or cancelled cycle leaves both markers at the
 * last fully acknowledged position. The engine never retries on its own.
 */
class SyncEngine {
public:
    SyncEngine(storage::Database& db,
               HttpChannel& channel,
               const crypto::SyncKey& key,
               SyncOptions options = {});
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * Upload every queued local change past the push marker.
     */
    [[nodiscard]] Result<SyncReport, Error> push();

    /**
     * Fetch and merge every page past the pull cursor.
     *
     * Fails with SyncCursorInvalid when the cursor lies past the server's
     * last global_seq (the server lost data) or inside a range the server
     * erased (the account was wiped after this client synced).
     */
    [[nodiscard]] Result<SyncReport, Error> pull();

    [[nodiscard]] Result<SyncReport, Error> run_cycle();

    /**
     * Reset both markers and run a full cycle: every local change is
     * pushed again and the whole server log is pulled. This is the
     * explicit recovery path after SyncCursorInvalid.
     */
    [[nodiscard]] Result<SyncReport, Error> full_resync();

    /**
     * Ask the running cycle to stop at the next batch or page boundary.
     * It then fails with ErrorCode::Cancelled.
     */
    void cancel() noexcept { cancel_requested_.store(true); }

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    [[nodiscard]] Result<int64_t, Error> server_count();

    [[nodiscard]] Result<LogStatus, Error> server_status();

    [[nodiscard]] Result<std::vector<HostSummary>, Error> host_index();

    [[nodiscard]] const SyncOptions& options() const noexcept { return options_; }

private:
    storage::Database& db_;
    HttpChannel& channel_;
    crypto::SyncKey key_;
    SyncOptions options_;
    storage::HistoryRepository history_;
    storage::SyncStateRepository state_;

    std::mutex cycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_requested_{false};

    template<typename F>
    [[nodiscard]] Result<SyncReport, Error> exclusive(const char* what, F&& body);

    [[nodiscard]] Result<void, Error> push_pass(SyncReport& report);
    [[nodiscard]] Result<void, Error> pull_pass(SyncReport& report);
    [[nodiscard]] Result<void, Error> check_cancelled();
    [[nodiscard]] Result<HttpResponse, Error> request(const HttpRequest& req);
};

} // namespace spool::network
