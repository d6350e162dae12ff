#include <catch2/catch_test_macros.hpp>
#include "core/history.hpp"

#include <chrono>

using namespace spool;

namespace {

HistoryRecord sample() {
    return make_record(*Uuid::parse("0b9a7a4e-3f7c-4d2b-9d55-3c0e1f2a4b6c"),
                       Timestamp(1'700'000'000'123'456'789),
                       "git status", "/home/me/src", "tty1", 0, 12'000'000);
}

} // namespace

TEST_CASE("Record ids are derived from identity fields", "[history]") {
    auto a = sample();
    auto b = sample();

    REQUIRE_FALSE(a.id.is_nil());
    REQUIRE(a.id == b.id);

    SECTION("every identity field changes the id") {
        REQUIRE(derive_record_id(Uuid::generate(), a.timestamp, a.session, a.cwd, a.command) != a.id);
        REQUIRE(derive_record_id(a.host_id, a.timestamp + std::chrono::nanoseconds(1),
                                 a.session, a.cwd, a.command) != a.id);
        REQUIRE(derive_record_id(a.host_id, a.timestamp, "tty2", a.cwd, a.command) != a.id);
        REQUIRE(derive_record_id(a.host_id, a.timestamp, a.session, "/tmp", a.command) != a.id);
        REQUIRE(derive_record_id(a.host_id, a.timestamp, a.session, a.cwd, "git log") != a.id);
    }

    SECTION("field boundaries are part of the id") {
        REQUIRE(derive_record_id(a.host_id, a.timestamp, "ab", "c", "x") !=
                derive_record_id(a.host_id, a.timestamp, "a", "bc", "x"));
    }

    SECTION("exit code and duration are not identity") {
        auto other = make_record(a.host_id, a.timestamp, a.command, a.cwd, a.session, 1, 5);
        REQUIRE(other.id == a.id);
    }
}

TEST_CASE("Tombstoning keeps identity and drops content", "[history]") {
    auto live = sample();
    auto dead = tombstone(live, Timestamp(1'800'000'000'000'000'000));

    REQUIRE(dead.is_deleted());
    REQUIRE(dead.id == live.id);
    REQUIRE(dead.host_id == live.host_id);
    REQUIRE(dead.timestamp == live.timestamp);
    REQUIRE(dead.session == live.session);
    REQUIRE(dead.command.empty());
    REQUIRE(dead.cwd.empty());
    REQUIRE_FALSE(live.is_deleted());
}

TEST_CASE("Envelope ids separate live records from tombstones", "[history]") {
    auto live = sample();

    REQUIRE(envelope_id_for(live) == live.id.to_string());

    auto first = tombstone(live, Timestamp(100));
    auto second = tombstone(live, Timestamp(200));
    REQUIRE(envelope_id_for(first) != envelope_id_for(live));
    REQUIRE(envelope_id_for(first) != envelope_id_for(second));
    REQUIRE(envelope_id_for(first) == envelope_id_for(tombstone(live, Timestamp(100))));
    REQUIRE(Uuid::parse(envelope_id_for(first)).has_value());
}

TEST_CASE("Canonical encoding round trips", "[history]") {
    SECTION("live record") {
        auto record = sample();
        auto decoded = decode_record(encode_record(record));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == record);
    }

    SECTION("tombstone") {
        auto record = tombstone(sample(), Timestamp(42));
        auto decoded = decode_record(encode_record(record));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == record);
    }

    SECTION("non-ASCII and empty fields") {
        auto record = make_record(Uuid::generate(), Timestamp(-5), "echo 'héllo ✓'", "", "");
        auto decoded = decode_record(encode_record(record));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == record);
    }
}

TEST_CASE("Decoding rejects malformed input", "[history]") {
    const auto good = encode_record(sample());

    SECTION("empty") {
        auto result = decode_record(std::vector<uint8_t>{});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::DecodeError);
    }

    SECTION("unknown format byte") {
        auto bytes = good;
        bytes[0] = 9;
        REQUIRE(decode_record(bytes).unwrap_err().code == ErrorCode::DecodeError);
    }

    SECTION("every truncation") {
        for (size_t len = 1; len < good.size(); ++len) {
            std::vector<uint8_t> cut(good.begin(), good.begin() + static_cast<long>(len));
            auto result = decode_record(cut);
            INFO("length " << len);
            REQUIRE(result.is_err());
            REQUIRE(result.unwrap_err().code == ErrorCode::DecodeError);
        }
    }

    SECTION("trailing bytes") {
        auto bytes = good;
        bytes.push_back(0);
        REQUIRE(decode_record(bytes).unwrap_err().code == ErrorCode::DecodeError);
    }

    SECTION("bad tombstone flag") {
        auto bytes = good;
        bytes.back() = 2;
        REQUIRE(decode_record(bytes).unwrap_err().code == ErrorCode::DecodeError);
    }

    SECTION("string length past the end") {
        auto bytes = good;
        // command length prefix follows format, two ids and three i64s
        const size_t offset = 1 + 16 + 16 + 8 * 3;
        bytes[offset] = 0x7F;
        REQUIRE(decode_record(bytes).unwrap_err().code == ErrorCode::DecodeError);
    }
}

TEST_CASE("Uuid parses and formats", "[history][types]") {
    auto id = Uuid::generate();
    auto text = id.to_string();

    REQUIRE(text.size() == 36);
    REQUIRE(Uuid::parse(text) == id);
    REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
    REQUIRE_FALSE(Uuid::from_bytes(std::vector<uint8_t>(15, 0)).has_value());
}
