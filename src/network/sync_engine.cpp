#include "network/sync_engine.hpp"

#include "crypto/encryption.hpp"

#include <QDebug>
#include <QLoggingCategory>
#include <QString>
#include <algorithm>

Q_LOGGING_CATEGORY(spoolSyncLog, "spool.sync")

namespace spool::network {

namespace {

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("SPOOL_DEBUG_SYNC");
}

void trace(const QString& message) {
    if (sync_debug_enabled()) {
        qInfo().noquote() << "SYNC:" << message;
    } else {
        qCDebug(spoolSyncLog).noquote() << message;
    }
}

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

// Rough wire size of one envelope once base64 encoded and wrapped in JSON.
size_t encoded_size(const Envelope& envelope) {
    constexpr size_t json_overhead = 128;
    return (envelope.ciphertext.size() + envelope.nonce.size()) * 4 / 3 +
           envelope.id.size() + envelope.host_token.size() + json_overhead;
}

} // namespace

SyncEngine::SyncEngine(storage::Database& db,
                       HttpChannel& channel,
                       const crypto::SyncKey& key,
                       SyncOptions options)
    : db_(db)
    , channel_(channel)
    , key_(key)
    , options_(std::move(options))
    , history_(db)
    , state_(db)
{
}

SyncEngine::~SyncEngine() {
    crypto::secure_zero(key_.data(), key_.size());
}

template<typename F>
Result<SyncReport, Error> SyncEngine::exclusive(const char* what, F&& body) {
    // running_ catches re-entry from the thread that already holds the lock.
    if (running_.load()) {
        return fail<SyncReport>(ErrorCode::Busy, "A sync cycle is already running");
    }
    std::unique_lock<std::mutex> lock(cycle_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return fail<SyncReport>(ErrorCode::Busy, "A sync cycle is already running");
    }
    running_.store(true);
    cancel_requested_.store(false);

    trace(QStringLiteral("%1 start scope=%2").arg(QLatin1String(what), q(options_.scope)));

    SyncReport report;
    auto result = body(report);
    running_.store(false);

    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        if (error.code == ErrorCode::Cancelled) {
            trace(QStringLiteral("%1 cancelled").arg(QLatin1String(what)));
        } else {
            qWarning().noquote() << "SYNC:" << what << "failed:" << q(error.describe());
        }
        return Result<SyncReport, Error>::err(error);
    }

    trace(QStringLiteral("%1 done pushed=%2 pulled=%3 merged=%4 failures=%5")
              .arg(QLatin1String(what))
              .arg(report.pushed)
              .arg(report.pulled)
              .arg(report.merged)
              .arg(report.failures.size()));
    return Result<SyncReport, Error>::ok(std::move(report));
}

Result<SyncReport, Error> SyncEngine::push() {
    return exclusive("push", [this](SyncReport& report) { return push_pass(report); });
}

Result<SyncReport, Error> SyncEngine::pull() {
    return exclusive("pull", [this](SyncReport& report) { return pull_pass(report); });
}

Result<SyncReport, Error> SyncEngine::run_cycle() {
    return exclusive("cycle", [this](SyncReport& report) {
        auto pushed = push_pass(report);
        if (pushed.is_err()) {
            return pushed;
        }
        return pull_pass(report);
    });
}

Result<SyncReport, Error> SyncEngine::full_resync() {
    return exclusive("full resync", [this](SyncReport& report) -> Result<void, Error> {
        qInfo().noquote() << "SYNC: full resync requested, resetting markers for"
                          << q(options_.scope);
        auto reset = db_.transaction([&]() -> Result<void, Error> {
            auto pulled = state_.reset_pull_cursor(options_.scope);
            if (pulled.is_err()) {
                return pulled;
            }
            return state_.reset_last_pushed(options_.scope);
        }, storage::TransactionMode::Immediate);
        if (reset.is_err()) {
            return reset;
        }
        auto pushed = push_pass(report);
        if (pushed.is_err()) {
            return pushed;
        }
        return pull_pass(report);
    });
}

Result<void, Error> SyncEngine::check_cancelled() {
    if (cancel_requested_.load()) {
        return fail(ErrorCode::Cancelled, "Sync cancelled");
    }
    return Result<void, Error>::ok();
}

Result<HttpResponse, Error> SyncEngine::request(const HttpRequest& req) {
    auto response = channel_.send(req);
    if (response.is_err()) {
        return response;
    }
    if (!response.unwrap().is_success()) {
        return Result<HttpResponse, Error>::err(
            error_from_response(response.unwrap().status, response.unwrap().body));
    }
    return response;
}

Result<void, Error> SyncEngine::push_pass(SyncReport& report) {
    auto marker_result = state_.last_pushed(options_.scope);
    if (marker_result.is_err()) {
        return Result<void, Error>::err(marker_result.unwrap_err());
    }
    int64_t marker = marker_result.unwrap();
    const size_t batch_size = std::clamp<size_t>(options_.push_batch_size, 1, MAX_BATCH_RECORDS);
    const size_t body_limit = static_cast<size_t>(MAX_BODY_BYTES) / 2;

    while (true) {
        auto cancelled = check_cancelled();
        if (cancelled.is_err()) {
            return cancelled;
        }

        auto changes_result = history_.records_since(marker, batch_size);
        if (changes_result.is_err()) {
            return Result<void, Error>::err(changes_result.unwrap_err());
        }
        const auto& changes = changes_result.unwrap();
        if (changes.empty()) {
            break;
        }

        std::vector<Envelope> batch;
        size_t body_size = 0;
        int64_t batch_end = marker;

        for (const auto& change : changes) {
            auto encrypted = crypto::encrypt(key_, change.record);
            if (encrypted.is_err()) {
                qWarning().noquote() << "SYNC: cannot encrypt record"
                                     << q(change.record.id.to_string()) << ":"
                                     << q(encrypted.unwrap_err().describe());
                report.failures.push_back({change.record.id.to_string(), encrypted.unwrap_err()});
                batch_end = change.change_seq;
                continue;
            }
            auto payload = std::move(encrypted).unwrap();

            if (payload.ciphertext.size() > MAX_CIPHERTEXT_BYTES) {
                Error error{ErrorCode::PayloadTooLarge,
                    "Record is " + std::to_string(payload.ciphertext.size()) +
                    " bytes encrypted, limit is " + std::to_string(MAX_CIPHERTEXT_BYTES)};
                qWarning().noquote() << "SYNC: skipping oversized record"
                                     << q(payload.envelope_id);
                report.failures.push_back({payload.envelope_id, std::move(error)});
                batch_end = change.change_seq;
                continue;
            }

            Envelope envelope{
                .id = std::move(payload.envelope_id),
                .host_token = crypto::host_token(key_, change.record.host_id),
                .ciphertext = std::move(payload.ciphertext),
                .nonce = std::move(payload.nonce),
                .version = payload.version,
                .global_seq = 0
            };

            const size_t size = encoded_size(envelope);
            if (!batch.empty() && body_size + size > body_limit) {
                break;  // the rest goes in the next batch
            }
            body_size += size;
            batch.push_back(std::move(envelope));
            batch_end = change.change_seq;
        }

        if (!batch.empty()) {
            auto response = request(HttpRequest{
                .method = HttpMethod::Post,
                .path = "/history",
                .query = {},
                .body = encode_push_batch(batch),
                .authorization = {}
            });
            if (response.is_err()) {
                return Result<void, Error>::err(response.unwrap_err());
            }

            auto accepted = decode_push_ack(response.unwrap().body);
            if (accepted.is_err()) {
                return Result<void, Error>::err(accepted.unwrap_err());
            }
            if (accepted.unwrap() != static_cast<int64_t>(batch.size())) {
                return fail(ErrorCode::MalformedPayload,
                    "Server acknowledged " + std::to_string(accepted.unwrap()) + " of " +
                    std::to_string(batch.size()) + " records");
            }
            report.pushed += static_cast<int64_t>(batch.size());
            trace(QStringLiteral("pushed batch of %1 up to change %2")
                      .arg(batch.size()).arg(batch_end));
        }

        auto advanced = state_.set_last_pushed(options_.scope, batch_end);
        if (advanced.is_err()) {
            return advanced;
        }
        marker = batch_end;
    }

    return Result<void, Error>::ok();
}

Result<void, Error> SyncEngine::pull_pass(SyncReport& report) {
    auto cursor_result = state_.pull_cursor(options_.scope);
    if (cursor_result.is_err()) {
        return Result<void, Error>::err(cursor_result.unwrap_err());
    }
    int64_t cursor = cursor_result.unwrap();

    auto status_result = server_status();
    if (status_result.is_err()) {
        return Result<void, Error>::err(status_result.unwrap_err());
    }
    const auto& status = status_result.unwrap();
    if (cursor > status.max_seq) {
        qCritical().noquote() << "SYNC: server log ends at" << status.max_seq
                              << "but this client already pulled up to" << cursor
                              << "- refusing to sync until a full resync is requested";
        return fail(ErrorCode::SyncCursorInvalid,
            "Server log ends at global_seq " + std::to_string(status.max_seq) +
            ", below the local cursor " + std::to_string(cursor));
    }
    if (cursor > 0 && cursor <= status.erased_through) {
        qCritical().noquote() << "SYNC: server erased this account through" << status.erased_through
                              << "after this client pulled up to" << cursor
                              << "- refusing to sync until a full resync is requested";
        return fail(ErrorCode::SyncCursorInvalid,
            "Server erased the account through global_seq " +
            std::to_string(status.erased_through) + ", covering the local cursor " +
            std::to_string(cursor));
    }

    const int64_t page_size = std::clamp<int64_t>(options_.page_size, 1, MAX_PAGE_SIZE);

    while (true) {
        auto cancelled = check_cancelled();
        if (cancelled.is_err()) {
            return cancelled;
        }

        auto response = request(HttpRequest{
            .method = HttpMethod::Get,
            .path = "/history",
            .query = encode_pull_query(PullRequest{.since = cursor, .limit = page_size}),
            .body = {},
            .authorization = {}
        });
        if (response.is_err()) {
            return Result<void, Error>::err(response.unwrap_err());
        }

        auto page_result = decode_pull_response(response.unwrap().body);
        if (page_result.is_err()) {
            return Result<void, Error>::err(page_result.unwrap_err());
        }
        const auto& page = page_result.unwrap();

        if (!page.records.empty() && page.records.front().global_seq <= cursor) {
            return fail(ErrorCode::MalformedPayload,
                "Page starts at global_seq " + std::to_string(page.records.front().global_seq) +
                ", not after " + std::to_string(cursor));
        }
        if (page.records.empty() && page.has_more) {
            return fail(ErrorCode::MalformedPayload, "Empty page claims more records");
        }
        if (static_cast<int64_t>(page.records.size()) > page_size) {
            return fail(ErrorCode::MalformedPayload,
                "Page of " + std::to_string(page.records.size()) +
                " records exceeds the requested limit");
        }

        // Merge the page and move the cursor together, or not at all.
        std::vector<RecordFailure> page_failures;
        int64_t page_merged = 0;
        auto committed = db_.transaction([&]() -> Result<void, Error> {
            for (const auto& envelope : page.records) {
                auto record = crypto::decrypt(key_, crypto::EncryptedPayload{
                    .envelope_id = envelope.id,
                    .version = envelope.version,
                    .nonce = envelope.nonce,
                    .ciphertext = envelope.ciphertext
                });
                if (record.is_err()) {
                    page_failures.push_back({envelope.id, record.unwrap_err()});
                    continue;
                }

                auto outcome = history_.merge_remote(record.unwrap());
                if (outcome.is_err()) {
                    return Result<void, Error>::err(outcome.unwrap_err());
                }
                if (outcome.unwrap() != storage::MergeOutcome::Unchanged) {
                    ++page_merged;
                }
            }
            if (page.records.empty()) {
                return Result<void, Error>::ok();
            }
            return state_.set_pull_cursor(options_.scope, page.records.back().global_seq);
        }, storage::TransactionMode::Immediate);
        if (committed.is_err()) {
            return committed;
        }

        for (auto& failure : page_failures) {
            qWarning().noquote() << "SYNC: skipping record" << q(failure.envelope_id) << ":"
                                 << q(failure.error.describe());
            report.failures.push_back(std::move(failure));
        }
        report.pulled += static_cast<int64_t>(page.records.size());
        report.merged += page_merged;
        if (!page.records.empty()) {
            cursor = page.records.back().global_seq;
        }
        trace(QStringLiteral("pulled page of %1 cursor=%2 has_more=%3")
                  .arg(page.records.size())
                  .arg(cursor)
                  .arg(page.has_more ? QStringLiteral("true") : QStringLiteral("false")));

        if (!page.has_more) {
            break;
        }
    }

    return Result<void, Error>::ok();
}

Result<int64_t, Error> SyncEngine::server_count() {
    return server_status().map([](const LogStatus& status) { return status.count; });
}

Result<LogStatus, Error> SyncEngine::server_status() {
    auto response = request(HttpRequest{
        .method = HttpMethod::Get,
        .path = "/history/count",
        .query = {},
        .body = {},
        .authorization = {}
    });
    if (response.is_err()) {
        return Result<LogStatus, Error>::err(response.unwrap_err());
    }
    return decode_count(response.unwrap().body);
}

Result<std::vector<HostSummary>, Error> SyncEngine::host_index() {
    auto response = request(HttpRequest{
        .method = HttpMethod::Get,
        .path = "/history/index",
        .query = {},
        .body = {},
        .authorization = {}
    });
    if (response.is_err()) {
        return Result<std::vector<HostSummary>, Error>::err(response.unwrap_err());
    }
    return decode_host_index(response.unwrap().body);
}

} // namespace spool::network
