#include <catch2/catch_test_macros.hpp>
#include "crypto/keys.hpp"
#include "network/protocol.hpp"
#include "support/fixtures.hpp"

using namespace spool;
using namespace spool::network;

namespace {

Envelope envelope() {
    return Envelope{
        .id = Uuid::generate().to_string(),
        .host_token = "host-a",
        .ciphertext = crypto::random_bytes(40),
        .nonce = crypto::random_bytes(24),
        .version = 1,
        .global_seq = 0
    };
}

HttpRequest request(HttpMethod method, const std::string& path, const std::string& token,
                    QByteArray body = {}, const std::string& query = {}) {
    return HttpRequest{
        .method = method,
        .path = path,
        .query = query,
        .body = std::move(body),
        .authorization = "Token " + token
    };
}

} // namespace

TEST_CASE("HistoryService: authentication", "[server][service]") {
    test::TestServer server;
    const auto token = server.sessions.create_session("alice");

    SECTION("missing header") {
        auto req = request(HttpMethod::Get, "/history/count", token);
        req.authorization.clear();
        REQUIRE(server.service.handle(req).status == 401);
    }

    SECTION("wrong scheme") {
        auto req = request(HttpMethod::Get, "/history/count", token);
        req.authorization = "Bearer " + token;
        REQUIRE(server.service.handle(req).status == 401);
    }

    SECTION("unknown token") {
        auto response = server.service.handle(
            request(HttpMethod::Get, "/history/count", "deadbeef"));
        REQUIRE(response.status == 401);
        REQUIRE(error_from_response(response.status, response.body).code ==
                ErrorCode::Unauthorized);
    }

    SECTION("revoked token") {
        REQUIRE(server.sessions.revoke(token));
        REQUIRE(server.service.handle(request(HttpMethod::Get, "/history/count", token)).status ==
                401);
    }

    SECTION("valid token") {
        auto response = server.service.handle(request(HttpMethod::Get, "/history/count", token));
        REQUIRE(response.status == 200);
        REQUIRE(decode_count(response.body).unwrap() == LogStatus{});
    }
}

TEST_CASE("HistoryService: routing", "[server][service]") {
    test::TestServer server;
    const auto token = server.sessions.create_session("alice");

    REQUIRE(server.service.handle(request(HttpMethod::Get, "/nope", token)).status == 404);
    REQUIRE(server.service.handle(request(HttpMethod::Delete, "/history", token)).status == 405);
    REQUIRE(server.service.handle(request(HttpMethod::Post, "/history/count", token)).status == 405);
    REQUIRE(server.service.handle(request(HttpMethod::Post, "/history/index", token)).status == 405);
    REQUIRE(server.service.handle(request(HttpMethod::Get, "/account", token)).status == 405);
}

TEST_CASE("HistoryService: push and pull", "[server][service]") {
    test::TestServer server;
    const auto token = server.sessions.create_session("alice");
    std::vector<Envelope> batch = {envelope(), envelope(), envelope()};

    auto pushed = server.service.handle(
        request(HttpMethod::Post, "/history", token, encode_push_batch(batch)));
    REQUIRE(pushed.status == 200);
    REQUIRE(decode_push_ack(pushed.body).unwrap() == 3);

    SECTION("replaying a batch acknowledges it again without duplicating") {
        auto replay = server.service.handle(
            request(HttpMethod::Post, "/history", token, encode_push_batch(batch)));
        REQUIRE(replay.status == 200);
        REQUIRE(decode_push_ack(replay.body).unwrap() == 3);
        REQUIRE(server.storage.count("alice").unwrap() == 3);
    }

    SECTION("pages follow the cursor") {
        auto first = server.service.handle(request(HttpMethod::Get, "/history", token, {},
            encode_pull_query({.since = 0, .limit = 2})));
        REQUIRE(first.status == 200);
        auto page = decode_pull_response(first.body).unwrap();
        REQUIRE(page.records.size() == 2);
        REQUIRE(page.records[0].id == batch[0].id);
        REQUIRE(page.records[0].global_seq == 1);
        REQUIRE(page.has_more);

        auto second = server.service.handle(request(HttpMethod::Get, "/history", token, {},
            encode_pull_query({.since = 2, .limit = 2})));
        auto rest = decode_pull_response(second.body).unwrap();
        REQUIRE(rest.records.size() == 1);
        REQUIRE(rest.records[0].id == batch[2].id);
        REQUIRE_FALSE(rest.has_more);
    }

    SECTION("other accounts see nothing") {
        const auto bob = server.sessions.create_session("bob");
        auto response = server.service.handle(request(HttpMethod::Get, "/history", bob, {},
            encode_pull_query({.since = 0, .limit = 10})));
        REQUIRE(decode_pull_response(response.body).unwrap().records.empty());
    }

    SECTION("host index") {
        auto response = server.service.handle(request(HttpMethod::Get, "/history/index", token));
        REQUIRE(response.status == 200);
        auto hosts = decode_host_index(response.body).unwrap();
        REQUIRE(hosts.size() == 1);
        REQUIRE(hosts[0].host_token == "host-a");
        REQUIRE(hosts[0].count == 3);
        REQUIRE(hosts[0].last_seq == 3);
    }

    SECTION("deleting the account erases data and ends every session") {
        const auto other_device = server.sessions.create_session("alice");
        const auto bob = server.sessions.create_session("bob");

        auto response = server.service.handle(request(HttpMethod::Delete, "/account", token));
        REQUIRE(response.status == 204);
        REQUIRE(server.storage.count("alice").unwrap() == 0);

        REQUIRE(server.service.handle(request(HttpMethod::Get, "/history/count", token)).status ==
                401);
        REQUIRE(server.service.handle(
                    request(HttpMethod::Get, "/history/count", other_device)).status == 401);
        REQUIRE(server.service.handle(request(HttpMethod::Get, "/history/count", bob)).status ==
                200);
    }
}

TEST_CASE("HistoryService: rejects bad input", "[server][service]") {
    test::TestServer server;
    const auto token = server.sessions.create_session("alice");

    SECTION("malformed batch is 400 and stores nothing") {
        auto response = server.service.handle(
            request(HttpMethod::Post, "/history", token, R"({"records":[{"id":"x"}]})"));
        REQUIRE(response.status == 400);
        REQUIRE(server.storage.count("alice").unwrap() == 0);
    }

    SECTION("bad query is 400") {
        REQUIRE(server.service.handle(
                    request(HttpMethod::Get, "/history", token, {}, "since=-4")).status == 400);
    }

    SECTION("oversized record is 413") {
        auto big = envelope();
        big.ciphertext = crypto::random_bytes(MAX_CIPHERTEXT_BYTES + 100);
        auto response = server.service.handle(
            request(HttpMethod::Post, "/history", token, encode_push_batch({big})));
        REQUIRE(response.status == 413);
    }

    SECTION("oversized body is 413 before authentication") {
        auto req = request(HttpMethod::Post, "/history", "wrong", QByteArray(MAX_BODY_BYTES + 1, 'x'));
        REQUIRE(server.service.handle(req).status == 413);
    }

    SECTION("storage failure is 500 without details") {
        REQUIRE(server.db.execute("DROP TABLE envelopes;").is_ok());
        auto response = server.service.handle(request(HttpMethod::Get, "/history/count", token));
        REQUIRE(response.status == 500);
        REQUIRE(error_from_response(response.status, response.body).message ==
                "HTTP 500: internal error");
    }
}

TEST_CASE("SessionStore", "[server][sessions]") {
    server::SessionStore sessions;

    auto a = sessions.create_session("alice");
    auto b = sessions.create_session("alice");
    auto c = sessions.create_session("carol");

    REQUIRE(a != b);
    REQUIRE(a.size() == 64);
    REQUIRE(sessions.size() == 3);
    REQUIRE(sessions.resolve(a) == "alice");
    REQUIRE(sessions.resolve(c) == "carol");
    REQUIRE_FALSE(sessions.resolve("").has_value());

    REQUIRE(sessions.revoke_all("alice") == 2);
    REQUIRE_FALSE(sessions.resolve(b).has_value());
    REQUIRE(sessions.resolve(c) == "carol");
    REQUIRE_FALSE(sessions.revoke(a));
    REQUIRE(sessions.revoke(c));
    REQUIRE(sessions.size() == 0);
}
