#include <catch2/catch_test_macros.hpp>
#include "crypto/keys.hpp"
#include "network/protocol.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace spool;
using namespace spool::network;

namespace {

Envelope envelope(int64_t seq = 0) {
    return Envelope{
        .id = Uuid::generate().to_string(),
        .host_token = "4f1c2a9be0d3c8a17f6e5b4d3c2b1a09",
        .ciphertext = crypto::random_bytes(48),
        .nonce = crypto::random_bytes(24),
        .version = 1,
        .global_seq = seq
    };
}

QJsonObject record_json(const Envelope& e) {
    QJsonObject obj;
    obj["id"] = QString::fromStdString(e.id);
    obj["host"] = QString::fromStdString(e.host_token);
    obj["data"] = QString::fromStdString(crypto::to_base64(e.ciphertext));
    obj["nonce"] = QString::fromStdString(crypto::to_base64(e.nonce));
    obj["version"] = static_cast<qint64>(e.version);
    return obj;
}

QByteArray batch_of(const QJsonArray& records) {
    QJsonObject obj;
    obj["records"] = records;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

ErrorCode push_error(const QJsonObject& record) {
    auto result = decode_push_batch(batch_of(QJsonArray{record}));
    REQUIRE(result.is_err());
    return result.unwrap_err().code;
}

} // namespace

TEST_CASE("Protocol: push batches", "[protocol]") {
    std::vector<Envelope> batch = {envelope(), envelope()};

    SECTION("round trip without sequence numbers") {
        auto decoded = decode_push_batch(encode_push_batch(batch));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == batch);
    }

    SECTION("wire field names") {
        const auto doc = QJsonDocument::fromJson(encode_push_batch(batch));
        const auto first = doc.object().value("records").toArray().at(0).toObject();
        REQUIRE(first.contains("id"));
        REQUIRE(first.contains("host"));
        REQUIRE(first.contains("data"));
        REQUIRE(first.contains("nonce"));
        REQUIRE(first.contains("version"));
        REQUIRE_FALSE(first.contains("global_seq"));
    }

    SECTION("empty batch is valid") {
        auto decoded = decode_push_batch(encode_push_batch({}));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().empty());
    }

    SECTION("not JSON, not an object, no records") {
        REQUIRE(decode_push_batch("{oops").unwrap_err().code == ErrorCode::MalformedPayload);
        REQUIRE(decode_push_batch("[]").unwrap_err().code == ErrorCode::MalformedPayload);
        REQUIRE(decode_push_batch("{}").unwrap_err().code == ErrorCode::MalformedPayload);
        REQUIRE(decode_push_batch(R"({"records":{}})").unwrap_err().code ==
                ErrorCode::MalformedPayload);
    }

    SECTION("invalid fields") {
        const auto good = record_json(envelope());

        auto no_id = good;
        no_id.remove("id");
        REQUIRE(push_error(no_id) == ErrorCode::MalformedPayload);

        auto bad_id = good;
        bad_id["id"] = "../../etc/passwd";
        REQUIRE(push_error(bad_id) == ErrorCode::MalformedPayload);

        auto no_host = good;
        no_host["host"] = "";
        REQUIRE(push_error(no_host) == ErrorCode::MalformedPayload);

        auto bad_data = good;
        bad_data["data"] = "***";
        REQUIRE(push_error(bad_data) == ErrorCode::MalformedPayload);

        auto no_nonce = good;
        no_nonce.remove("nonce");
        REQUIRE(push_error(no_nonce) == ErrorCode::MalformedPayload);

        auto zero_version = good;
        zero_version["version"] = 0;
        REQUIRE(push_error(zero_version) == ErrorCode::MalformedPayload);

        auto fractional_version = good;
        fractional_version["version"] = 1.5;
        REQUIRE(push_error(fractional_version) == ErrorCode::MalformedPayload);

        auto not_object = decode_push_batch(batch_of(QJsonArray{42}));
        REQUIRE(not_object.unwrap_err().code == ErrorCode::MalformedPayload);
    }

    SECTION("oversized ciphertext") {
        auto big = envelope();
        big.ciphertext = crypto::random_bytes(MAX_CIPHERTEXT_BYTES + 1);
        REQUIRE(push_error(record_json(big)) == ErrorCode::PayloadTooLarge);

        auto at_limit = envelope();
        at_limit.ciphertext = crypto::random_bytes(MAX_CIPHERTEXT_BYTES);
        REQUIRE(decode_push_batch(encode_push_batch({at_limit})).is_ok());
    }

    SECTION("too many records") {
        QJsonArray records;
        const auto one = record_json(envelope());
        for (size_t i = 0; i <= MAX_BATCH_RECORDS; ++i) {
            records.append(one);
        }
        REQUIRE(decode_push_batch(batch_of(records)).unwrap_err().code ==
                ErrorCode::PayloadTooLarge);
    }

    SECTION("oversized body") {
        QByteArray body(MAX_BODY_BYTES + 1, ' ');
        REQUIRE(decode_push_batch(body).unwrap_err().code == ErrorCode::PayloadTooLarge);
    }
}

TEST_CASE("Protocol: push acknowledgement", "[protocol]") {
    REQUIRE(decode_push_ack(encode_push_ack(17)).unwrap() == 17);
    REQUIRE(decode_push_ack(R"({"accepted":-1})").unwrap_err().code == ErrorCode::MalformedPayload);
    REQUIRE(decode_push_ack(R"({"count":3})").unwrap_err().code == ErrorCode::MalformedPayload);

    // Doubles at or past 2^63 do not fit an int64_t.
    REQUIRE(decode_push_ack(R"({"accepted":9223372036854775808})").unwrap_err().code ==
            ErrorCode::MalformedPayload);
    REQUIRE(decode_push_ack(R"({"accepted":9223372036854775807})").unwrap_err().code ==
            ErrorCode::MalformedPayload);
    REQUIRE(decode_push_ack(R"({"accepted":1e300})").unwrap_err().code ==
            ErrorCode::MalformedPayload);
    REQUIRE(decode_push_ack(R"({"accepted":9223372036854774784})").unwrap() ==
            INT64_C(9223372036854774784));
}

TEST_CASE("Protocol: pull query", "[protocol]") {
    SECTION("round trip") {
        auto decoded = decode_pull_query(encode_pull_query(PullRequest{.since = 42, .limit = 10}));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().since == 42);
        REQUIRE(decoded.unwrap().limit == 10);
    }

    SECTION("limit defaults") {
        auto decoded = decode_pull_query("since=0");
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().limit == DEFAULT_PAGE_SIZE);
    }

    SECTION("invalid values") {
        REQUIRE(decode_pull_query("").is_err());
        REQUIRE(decode_pull_query("since=abc").is_err());
        REQUIRE(decode_pull_query("since=-1").is_err());
        REQUIRE(decode_pull_query("since=0&limit=0").is_err());
        REQUIRE(decode_pull_query("since=0&limit=1001").unwrap_err().code ==
                ErrorCode::MalformedPayload);
    }
}

TEST_CASE("Protocol: pull response", "[protocol]") {
    PullResponse response{.records = {envelope(1), envelope(2), envelope(5)}, .has_more = true};

    SECTION("round trip with sequence numbers") {
        auto decoded = decode_pull_response(encode_pull_response(response));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().records == response.records);
        REQUIRE(decoded.unwrap().has_more);
    }

    SECTION("has_more is required") {
        REQUIRE(decode_pull_response(R"({"records":[]})").unwrap_err().code ==
                ErrorCode::MalformedPayload);
    }

    SECTION("sequence numbers must ascend") {
        PullResponse unordered{.records = {envelope(3), envelope(2)}, .has_more = false};
        REQUIRE(decode_pull_response(encode_pull_response(unordered)).unwrap_err().code ==
                ErrorCode::MalformedPayload);

        PullResponse repeated{.records = {envelope(3), envelope(3)}, .has_more = false};
        REQUIRE(decode_pull_response(encode_pull_response(repeated)).is_err());
    }

    SECTION("sequence numbers start at one") {
        PullResponse zero{.records = {envelope(0)}, .has_more = false};
        REQUIRE(decode_pull_response(encode_pull_response(zero)).unwrap_err().code ==
                ErrorCode::MalformedPayload);
    }
}

TEST_CASE("Protocol: count and host index", "[protocol]") {
    REQUIRE(decode_count(encode_count(LogStatus{})).unwrap() == LogStatus{});
    const LogStatus erased{.count = 5, .max_seq = 123456789, .erased_through = 100};
    REQUIRE(decode_count(encode_count(erased)).unwrap() == erased);

    auto rejects = [](const char* body) {
        INFO(body);
        auto decoded = decode_count(QByteArray(body));
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::MalformedPayload);
    };
    rejects(R"({"count":"7","max_seq":7,"erased_through":0})");
    rejects(R"({"count":7})");
    rejects(R"({"count":3,"max_seq":2,"erased_through":0})");
    rejects(R"({"count":0,"max_seq":2,"erased_through":3})");
    rejects(R"({"count":3,"max_seq":5,"erased_through":4})");

    std::vector<HostSummary> hosts = {{"aaaa", 3, 10}, {"bbbb", 1, 4}};
    auto decoded = decode_host_index(encode_host_index(hosts));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap() == hosts);
    REQUIRE(decode_host_index(R"({"hosts":[{"host":"a"}]})").is_err());
}

TEST_CASE("Protocol: error responses map to error codes", "[protocol]") {
    const auto body = encode_error("bad things");

    auto bad_request = error_from_response(400, body);
    REQUIRE(bad_request.code == ErrorCode::MalformedPayload);
    REQUIRE(bad_request.message == "HTTP 400: bad things");

    REQUIRE(error_from_response(401, body).code == ErrorCode::Unauthorized);
    REQUIRE(error_from_response(413, body).code == ErrorCode::PayloadTooLarge);
    REQUIRE(error_from_response(500, body).code == ErrorCode::Transport);
    REQUIRE(error_from_response(503, "<html>").code == ErrorCode::Transport);
    REQUIRE(error_from_response(503, "<html>").message == "HTTP 503");
}
