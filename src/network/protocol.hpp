#pragma once

#include "core/envelope.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QString>
#include <cstdint>
#include <string>
#include <vector>

namespace spool::network {

// Policy limits. Changing them does not change the wire contract.
constexpr size_t MAX_BATCH_RECORDS = 1000;
constexpr int64_t MAX_PAGE_SIZE = 1000;
constexpr int64_t DEFAULT_PAGE_SIZE = 250;
constexpr size_t MAX_CIPHERTEXT_BYTES = 64 * 1024;
constexpr size_t MAX_NONCE_BYTES = 64;
constexpr size_t MAX_ID_LENGTH = 64;
constexpr size_t MAX_HOST_TOKEN_LENGTH = 128;
constexpr qsizetype MAX_BODY_BYTES = 8 * 1024 * 1024;

/**
 * GET /history query: records with global_seq > since, at most limit.
 */
struct PullRequest {
    int64_t since{0};
    int64_t limit{DEFAULT_PAGE_SIZE};
};

struct PullResponse {
    std::vector<Envelope> records;
    bool has_more{false};
};

/**
 * GET /history/count. A pull cursor is only meaningful when it lies in
 * (erased_through, max_seq], or is 0.
 */
struct LogStatus {
    int64_t count{0};
    int64_t max_seq{0};
    int64_t erased_through{0};

    bool operator==(const LogStatus&) const = default;
};

/**
 * One row of GET /history/index.
 */
struct HostSummary {
    std::string host_token;
    int64_t count{0};
    int64_t last_seq{0};

    bool operator==(const HostSummary&) const = default;
};

// POST /history body: {"records":[{id,host,data,nonce,version}]}
[[nodiscard]] QByteArray encode_push_batch(const std::vector<Envelope>& batch);
[[nodiscard]] Result<std::vector<Envelope>, Error> decode_push_batch(const QByteArray& body);

// POST /history response: {"accepted":n}
[[nodiscard]] QByteArray encode_push_ack(int64_t accepted);
[[nodiscard]] Result<int64_t, Error> decode_push_ack(const QByteArray& body);

// GET /history query string: since=<n>&limit=<n>
[[nodiscard]] std::string encode_pull_query(const PullRequest& request);
[[nodiscard]] Result<PullRequest, Error> decode_pull_query(const std::string& query);

// GET /history response: {"records":[{...,global_seq}],"has_more":bool}
[[nodiscard]] QByteArray encode_pull_response(const PullResponse& response);
[[nodiscard]] Result<PullResponse, Error> decode_pull_response(const QByteArray& body);

// GET /history/count response: {"count":n,"max_seq":n,"erased_through":n}
[[nodiscard]] QByteArray encode_count(const LogStatus& status);
[[nodiscard]] Result<LogStatus, Error> decode_count(const QByteArray& body);

// GET /history/index response: {"hosts":[{host,count,last_seq}]}
[[nodiscard]] QByteArray encode_host_index(const std::vector<HostSummary>& hosts);
[[nodiscard]] Result<std::vector<HostSummary>, Error> decode_host_index(const QByteArray& body);

// Any failed request: {"error":msg}
[[nodiscard]] QByteArray encode_error(const QString& message);

/**
 * Client-side view of a non-2xx response: 400 MalformedPayload,
 * 401 Unauthorized, 413 PayloadTooLarge, anything else Transport.
 */
[[nodiscard]] Error error_from_response(int status, const QByteArray& body);

} // namespace spool::network
