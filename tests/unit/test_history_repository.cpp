#include <catch2/catch_test_macros.hpp>
#include "storage/history_repository.hpp"
#include "support/fixtures.hpp"

using namespace spool;
using namespace spool::storage;

namespace {

HistoryRecord record_at(const Uuid& host, int64_t nanos, const std::string& command) {
    return make_record(host, Timestamp(nanos), command, "/work", "s1");
}

} // namespace

TEST_CASE("HistoryRepository: append and read", "[storage][history]") {
    auto db = test::open_local_db();
    HistoryRepository repo(db);
    const auto host = Uuid::generate();

    auto first = record_at(host, 1000, "make");
    auto second = record_at(host, 2000, "make test");
    REQUIRE(repo.append(first).is_ok());
    REQUIRE(repo.append(second).is_ok());

    SECTION("get returns the stored record") {
        auto fetched = repo.get(first.id);
        REQUIRE(fetched.is_ok());
        REQUIRE(fetched.unwrap().has_value());
        REQUIRE(*fetched.unwrap() == first);
    }

    SECTION("unknown id is empty, not an error") {
        auto fetched = repo.get(Uuid::generate());
        REQUIRE(fetched.is_ok());
        REQUIRE_FALSE(fetched.unwrap().has_value());
    }

    SECTION("appending the same id twice is DuplicateId") {
        auto again = repo.append(first);
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().code == ErrorCode::DuplicateId);
        REQUIRE(repo.count().unwrap() == 2);
    }

    SECTION("list is most recent first and pages") {
        auto all = repo.list(10).unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].id == second.id);
        REQUIRE(all[1].id == first.id);

        auto page = repo.list(1, 1).unwrap();
        REQUIRE(page.size() == 1);
        REQUIRE(page[0].id == first.id);
    }

    SECTION("appends are queued in order") {
        auto queued = repo.records_since(0, 10).unwrap();
        REQUIRE(queued.size() == 2);
        REQUIRE(queued[0].record.id == first.id);
        REQUIRE(queued[1].record.id == second.id);
        REQUIRE(queued[0].change_seq < queued[1].change_seq);

        auto after_first = repo.records_since(queued[0].change_seq, 10).unwrap();
        REQUIRE(after_first.size() == 1);
        REQUIRE(after_first[0].record.id == second.id);

        REQUIRE(repo.records_since(0, 1).unwrap().size() == 1);
        REQUIRE(repo.pending_count(0).unwrap() == 2);
        REQUIRE(repo.pending_count(queued[1].change_seq).unwrap() == 0);
    }
}

TEST_CASE("HistoryRepository: local deletion", "[storage][history]") {
    auto db = test::open_local_db();
    HistoryRepository repo(db);
    auto record = record_at(Uuid::generate(), 1000, "export TOKEN=secret");
    REQUIRE(repo.append(record).is_ok());
    const auto appended_seq = repo.records_since(0, 10).unwrap().back().change_seq;

    SECTION("unknown id is NotFound") {
        auto result = repo.mark_deleted(Uuid::generate(), Timestamp(5000));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::NotFound);
    }

    SECTION("deletion clears content and requeues the record") {
        REQUIRE(repo.mark_deleted(record.id, Timestamp(5000)).is_ok());

        auto stored = *repo.get(record.id).unwrap();
        REQUIRE(stored.is_deleted());
        REQUIRE(*stored.deleted_at == Timestamp(5000));
        REQUIRE(stored.command.empty());
        REQUIRE(stored.cwd.empty());

        REQUIRE(repo.count().unwrap() == 0);
        REQUIRE(repo.count(true).unwrap() == 1);
        REQUIRE(repo.list(10).unwrap().empty());

        auto queued = repo.records_since(appended_seq, 10).unwrap();
        REQUIRE(queued.size() == 1);
        REQUIRE(queued[0].record.is_deleted());
    }

    SECTION("deleting twice keeps the first deletion") {
        REQUIRE(repo.mark_deleted(record.id, Timestamp(5000)).is_ok());
        const auto seq = repo.records_since(0, 10).unwrap().back().change_seq;

        REQUIRE(repo.mark_deleted(record.id, Timestamp(9000)).is_ok());
        REQUIRE(*repo.get(record.id).unwrap()->deleted_at == Timestamp(5000));
        REQUIRE(repo.records_since(seq, 10).unwrap().empty());
    }
}

TEST_CASE("HistoryRepository: merging remote records", "[storage][history]") {
    auto db = test::open_local_db();
    HistoryRepository repo(db);
    auto live = record_at(Uuid::generate(), 1000, "ls -la");

    SECTION("new live record is inserted but not queued") {
        REQUIRE(repo.merge_remote(live).unwrap() == MergeOutcome::Inserted);
        REQUIRE(*repo.get(live.id).unwrap() == live);
        REQUIRE(repo.pending_count(0).unwrap() == 0);
    }

    SECTION("same record again is unchanged") {
        REQUIRE(repo.merge_remote(live).unwrap() == MergeOutcome::Inserted);
        REQUIRE(repo.merge_remote(live).unwrap() == MergeOutcome::Unchanged);
        REQUIRE(repo.count().unwrap() == 1);
    }

    SECTION("unknown tombstone is stored as a tombstone") {
        auto dead = tombstone(live, Timestamp(3000));
        REQUIRE(repo.merge_remote(dead).unwrap() == MergeOutcome::Tombstoned);
        REQUIRE(repo.get(live.id).unwrap()->is_deleted());
        REQUIRE(repo.count().unwrap() == 0);
    }

    SECTION("tombstone wins over a live copy") {
        REQUIRE(repo.append(live).is_ok());
        REQUIRE(repo.merge_remote(tombstone(live, Timestamp(3000))).unwrap() ==
                MergeOutcome::Tombstoned);

        auto stored = *repo.get(live.id).unwrap();
        REQUIRE(stored.is_deleted());
        REQUIRE(stored.command.empty());
    }

    SECTION("a live copy never resurrects a deleted record") {
        REQUIRE(repo.append(live).is_ok());
        REQUIRE(repo.mark_deleted(live.id, Timestamp(3000)).is_ok());

        REQUIRE(repo.merge_remote(live).unwrap() == MergeOutcome::Unchanged);
        REQUIRE(repo.get(live.id).unwrap()->is_deleted());
    }

    SECTION("the later deletion time is kept") {
        REQUIRE(repo.merge_remote(tombstone(live, Timestamp(3000))).is_ok());

        REQUIRE(repo.merge_remote(tombstone(live, Timestamp(2000))).unwrap() ==
                MergeOutcome::Unchanged);
        REQUIRE(*repo.get(live.id).unwrap()->deleted_at == Timestamp(3000));

        REQUIRE(repo.merge_remote(tombstone(live, Timestamp(4000))).unwrap() ==
                MergeOutcome::Tombstoned);
        REQUIRE(*repo.get(live.id).unwrap()->deleted_at == Timestamp(4000));
    }

    SECTION("remote tombstone of a local record does not requeue it") {
        REQUIRE(repo.append(live).is_ok());
        const auto seq = repo.records_since(0, 10).unwrap().back().change_seq;
        REQUIRE(repo.merge_remote(tombstone(live, Timestamp(3000))).is_ok());
        REQUIRE(repo.records_since(seq, 10).unwrap().empty());
    }
}
