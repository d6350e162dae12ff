#include "network/protocol.hpp"

#include "core/types.hpp"
#include "crypto/keys.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>
#include <cmath>
#include <limits>
#include <optional>

namespace spool::network {

namespace {

QByteArray to_bytes(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Error malformed(const std::string& what) {
    return Error{ErrorCode::MalformedPayload, what};
}

Result<QJsonObject, Error> parse_object(const QByteArray& body) {
    if (body.size() > MAX_BODY_BYTES) {
        return fail<QJsonObject>(ErrorCode::PayloadTooLarge,
            "Body of " + std::to_string(body.size()) + " bytes exceeds " +
            std::to_string(MAX_BODY_BYTES));
    }
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<QJsonObject, Error>::err(
            malformed("Invalid JSON: " + err.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<QJsonObject, Error>::err(malformed("Expected a JSON object"));
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

// JSON numbers are doubles; accept only integral values inside [min, max].
std::optional<int64_t> read_int(const QJsonObject& obj, const char* key,
                                int64_t min, int64_t max) {
    const auto value = obj.value(QLatin1String(key));
    if (!value.isDouble()) return std::nullopt;
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
    // INT64_MAX rounds up to 2^63 as a double, so bound the cast exactly.
    if (d < -0x1p63 || d >= 0x1p63) return std::nullopt;
    const auto i = static_cast<int64_t>(d);
    if (i < min || i > max) return std::nullopt;
    return i;
}

std::optional<std::string> read_string(const QJsonObject& obj, const char* key,
                                       size_t max_length) {
    const auto value = obj.value(QLatin1String(key));
    if (!value.isString()) return std::nullopt;
    auto str = value.toString().toStdString();
    if (str.empty() || str.size() > max_length) return std::nullopt;
    return str;
}

QJsonObject envelope_to_json(const Envelope& envelope, bool with_seq) {
    QJsonObject obj;
    obj["id"] = QString::fromStdString(envelope.id);
    obj["host"] = QString::fromStdString(envelope.host_token);
    obj["data"] = QString::fromStdString(crypto::to_base64(envelope.ciphertext));
    obj["nonce"] = QString::fromStdString(crypto::to_base64(envelope.nonce));
    obj["version"] = static_cast<qint64>(envelope.version);
    if (with_seq) {
        obj["global_seq"] = static_cast<qint64>(envelope.global_seq);
    }
    return obj;
}

Result<Envelope, Error> envelope_from_json(const QJsonValue& value, bool with_seq) {
    if (!value.isObject()) {
        return Result<Envelope, Error>::err(malformed("Record is not an object"));
    }
    const auto obj = value.toObject();
    Envelope envelope;

    auto id = read_string(obj, "id", MAX_ID_LENGTH);
    if (!id || !Uuid::parse(*id)) {
        return Result<Envelope, Error>::err(malformed("Record has a missing or invalid id"));
    }
    envelope.id = std::move(*id);

    auto host = read_string(obj, "host", MAX_HOST_TOKEN_LENGTH);
    if (!host) {
        return Result<Envelope, Error>::err(
            malformed("Record " + envelope.id + " has no host token"));
    }
    envelope.host_token = std::move(*host);

    const auto data = obj.value("data");
    if (!data.isString()) {
        return Result<Envelope, Error>::err(malformed("Record " + envelope.id + " has no data"));
    }
    // Base64 inflates by 4/3; reject before decoding.
    const auto data_str = data.toString().toStdString();
    if (data_str.size() > (MAX_CIPHERTEXT_BYTES + 2) / 3 * 4) {
        return fail<Envelope>(ErrorCode::PayloadTooLarge,
            "Record " + envelope.id + " exceeds " + std::to_string(MAX_CIPHERTEXT_BYTES) +
            " bytes of ciphertext");
    }
    auto ciphertext = crypto::from_base64(data_str);
    if (ciphertext.is_err() || ciphertext.unwrap().empty()) {
        return Result<Envelope, Error>::err(
            malformed("Record " + envelope.id + " has invalid data"));
    }
    envelope.ciphertext = std::move(ciphertext).unwrap();
    if (envelope.ciphertext.size() > MAX_CIPHERTEXT_BYTES) {
        return fail<Envelope>(ErrorCode::PayloadTooLarge,
            "Record " + envelope.id + " exceeds " + std::to_string(MAX_CIPHERTEXT_BYTES) +
            " bytes of ciphertext");
    }

    const auto nonce = obj.value("nonce");
    auto nonce_bytes = nonce.isString()
        ? crypto::from_base64(nonce.toString().toStdString())
        : fail<std::vector<uint8_t>>(ErrorCode::MalformedPayload, "missing");
    if (nonce_bytes.is_err() || nonce_bytes.unwrap().empty() ||
        nonce_bytes.unwrap().size() > MAX_NONCE_BYTES) {
        return Result<Envelope, Error>::err(
            malformed("Record " + envelope.id + " has an invalid nonce"));
    }
    envelope.nonce = std::move(nonce_bytes).unwrap();

    auto version = read_int(obj, "version", 1, std::numeric_limits<uint32_t>::max());
    if (!version) {
        return Result<Envelope, Error>::err(
            malformed("Record " + envelope.id + " has an invalid version"));
    }
    envelope.version = static_cast<uint32_t>(*version);

    if (with_seq) {
        auto seq = read_int(obj, "global_seq", 1, std::numeric_limits<int64_t>::max());
        if (!seq) {
            return Result<Envelope, Error>::err(
                malformed("Record " + envelope.id + " has an invalid global_seq"));
        }
        envelope.global_seq = *seq;
    }

    return Result<Envelope, Error>::ok(std::move(envelope));
}

Result<std::vector<Envelope>, Error> records_from_json(const QJsonObject& obj, bool with_seq) {
    const auto records = obj.value("records");
    if (!records.isArray()) {
        return Result<std::vector<Envelope>, Error>::err(malformed("Missing records array"));
    }
    const auto array = records.toArray();
    if (static_cast<size_t>(array.size()) > MAX_BATCH_RECORDS) {
        return fail<std::vector<Envelope>>(ErrorCode::PayloadTooLarge,
            std::to_string(array.size()) + " records exceed the limit of " +
            std::to_string(MAX_BATCH_RECORDS));
    }

    std::vector<Envelope> out;
    out.reserve(static_cast<size_t>(array.size()));
    for (const auto& value : array) {
        auto envelope = envelope_from_json(value, with_seq);
        if (envelope.is_err()) {
            return Result<std::vector<Envelope>, Error>::err(envelope.unwrap_err());
        }
        out.push_back(std::move(envelope).unwrap());
    }
    return Result<std::vector<Envelope>, Error>::ok(std::move(out));
}

Result<int64_t, Error> decode_single_int(const QByteArray& body, const char* key) {
    auto obj = parse_object(body);
    if (obj.is_err()) {
        return Result<int64_t, Error>::err(obj.unwrap_err());
    }
    auto value = read_int(obj.unwrap(), key, 0, std::numeric_limits<int64_t>::max());
    if (!value) {
        return Result<int64_t, Error>::err(
            malformed(std::string("Missing or invalid \"") + key + "\""));
    }
    return Result<int64_t, Error>::ok(*value);
}

} // namespace

QByteArray encode_push_batch(const std::vector<Envelope>& batch) {
    QJsonArray records;
    for (const auto& envelope : batch) {
        records.append(envelope_to_json(envelope, false));
    }
    QJsonObject obj;
    obj["records"] = records;
    return to_bytes(obj);
}

Result<std::vector<Envelope>, Error> decode_push_batch(const QByteArray& body) {
    auto obj = parse_object(body);
    if (obj.is_err()) {
        return Result<std::vector<Envelope>, Error>::err(obj.unwrap_err());
    }
    return records_from_json(obj.unwrap(), false);
}

QByteArray encode_push_ack(int64_t accepted) {
    QJsonObject obj;
    obj["accepted"] = static_cast<qint64>(accepted);
    return to_bytes(obj);
}

Result<int64_t, Error> decode_push_ack(const QByteArray& body) {
    return decode_single_int(body, "accepted");
}

std::string encode_pull_query(const PullRequest& request) {
    return "since=" + std::to_string(request.since) + "&limit=" + std::to_string(request.limit);
}

Result<PullRequest, Error> decode_pull_query(const std::string& query) {
    const QUrlQuery q(QString::fromStdString(query));
    PullRequest request;

    if (!q.hasQueryItem("since")) {
        return Result<PullRequest, Error>::err(malformed("Missing since parameter"));
    }
    bool ok = false;
    request.since = q.queryItemValue("since").toLongLong(&ok);
    if (!ok || request.since < 0) {
        return Result<PullRequest, Error>::err(malformed("Invalid since parameter"));
    }

    if (q.hasQueryItem("limit")) {
        request.limit = q.queryItemValue("limit").toLongLong(&ok);
        if (!ok || request.limit < 1 || request.limit > MAX_PAGE_SIZE) {
            return Result<PullRequest, Error>::err(malformed(
                "limit must be between 1 and " + std::to_string(MAX_PAGE_SIZE)));
        }
    }
    return Result<PullRequest, Error>::ok(request);
}

QByteArray encode_pull_response(const PullResponse& response) {
    QJsonArray records;
    for (const auto& envelope : response.records) {
        records.append(envelope_to_json(envelope, true));
    }
    QJsonObject obj;
    obj["records"] = records;
    obj["has_more"] = response.has_more;
    return to_bytes(obj);
}

Result<PullResponse, Error> decode_pull_response(const QByteArray& body) {
    auto obj = parse_object(body);
    if (obj.is_err()) {
        return Result<PullResponse, Error>::err(obj.unwrap_err());
    }

    const auto has_more = obj.unwrap().value("has_more");
    if (!has_more.isBool()) {
        return Result<PullResponse, Error>::err(malformed("Missing has_more flag"));
    }

    auto records = records_from_json(obj.unwrap(), true);
    if (records.is_err()) {
        return Result<PullResponse, Error>::err(records.unwrap_err());
    }

    PullResponse response{
        .records = std::move(records).unwrap(),
        .has_more = has_more.toBool()
    };
    for (size_t i = 1; i < response.records.size(); ++i) {
        if (response.records[i].global_seq <= response.records[i - 1].global_seq) {
            return Result<PullResponse, Error>::err(malformed("Page is not ordered by global_seq"));
        }
    }
    return Result<PullResponse, Error>::ok(std::move(response));
}

QByteArray encode_count(const LogStatus& status) {
    QJsonObject obj;
    obj["count"] = static_cast<qint64>(status.count);
    obj["max_seq"] = static_cast<qint64>(status.max_seq);
    obj["erased_through"] = static_cast<qint64>(status.erased_through);
    return to_bytes(obj);
}

Result<LogStatus, Error> decode_count(const QByteArray& body) {
    auto obj = parse_object(body);
    if (obj.is_err()) {
        return Result<LogStatus, Error>::err(obj.unwrap_err());
    }
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    const auto count = read_int(obj.unwrap(), "count", 0, max);
    const auto max_seq = read_int(obj.unwrap(), "max_seq", 0, max);
    const auto erased_through = read_int(obj.unwrap(), "erased_through", 0, max);
    if (!count || !max_seq || !erased_through) {
        return Result<LogStatus, Error>::err(
            malformed("Count needs integer \"count\", \"max_seq\" and \"erased_through\""));
    }
    if (*erased_through > *max_seq || *count > *max_seq - *erased_through) {
        return Result<LogStatus, Error>::err(
            malformed("Count fields are inconsistent: count=" + std::to_string(*count) +
                      " max_seq=" + std::to_string(*max_seq) +
                      " erased_through=" + std::to_string(*erased_through)));
    }
    return Result<LogStatus, Error>::ok(LogStatus{
        .count = *count,
        .max_seq = *max_seq,
        .erased_through = *erased_through
    });
}

QByteArray encode_host_index(const std::vector<HostSummary>& hosts) {
    QJsonArray array;
    for (const auto& host : hosts) {
        QJsonObject entry;
        entry["host"] = QString::fromStdString(host.host_token);
        entry["count"] = static_cast<qint64>(host.count);
        entry["last_seq"] = static_cast<qint64>(host.last_seq);
        array.append(entry);
    }
    QJsonObject obj;
    obj["hosts"] = array;
    return to_bytes(obj);
}

Result<std::vector<HostSummary>, Error> decode_host_index(const QByteArray& body) {
    auto obj = parse_object(body);
    if (obj.is_err()) {
        return Result<std::vector<HostSummary>, Error>::err(obj.unwrap_err());
    }
    const auto hosts = obj.unwrap().value("hosts");
    if (!hosts.isArray()) {
        return Result<std::vector<HostSummary>, Error>::err(malformed("Missing hosts array"));
    }

    std::vector<HostSummary> out;
    for (const auto& value : hosts.toArray()) {
        const auto entry = value.toObject();
        auto token = read_string(entry, "host", MAX_HOST_TOKEN_LENGTH);
        auto count = read_int(entry, "count", 0, std::numeric_limits<int64_t>::max());
        auto last_seq = read_int(entry, "last_seq", 0, std::numeric_limits<int64_t>::max());
        if (!value.isObject() || !token || !count || !last_seq) {
            return Result<std::vector<HostSummary>, Error>::err(malformed("Invalid host entry"));
        }
        out.push_back(HostSummary{*token, *count, *last_seq});
    }
    return Result<std::vector<HostSummary>, Error>::ok(std::move(out));
}

QByteArray encode_error(const QString& message) {
    QJsonObject obj;
    obj["error"] = message;
    return to_bytes(obj);
}

Error error_from_response(int status, const QByteArray& body) {
    std::string message = "HTTP " + std::to_string(status);
    const auto doc = QJsonDocument::fromJson(body);
    if (doc.isObject() && doc.object().value("error").isString()) {
        message += ": " + doc.object().value("error").toString().toStdString();
    }

    switch (status) {
        case 400: return Error{ErrorCode::MalformedPayload, message};
        case 401: return Error{ErrorCode::Unauthorized, message};
        case 413: return Error{ErrorCode::PayloadTooLarge, message};
        default: return Error{ErrorCode::Transport, message};
    }
}

} // namespace spool::network
