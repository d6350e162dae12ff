#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace spool {

/**
 * HistoryRecord - One executed shell command, the unit of sync.
 *
 * The id is derived from the identity fields when the record is made and
 * never changes. The only permitted transition afterwards is
 * deleted_at going from empty to set; tombstoning discards the command
 * text and working directory but keeps the id so the deletion can sync.
 */
struct HistoryRecord {
    Uuid id;
    Uuid host_id;
    Timestamp timestamp;
    int64_t duration{0};    // nanoseconds
    int64_t exit_code{0};
    std::string command;
    std::string cwd;
    std::string session;
    std::optional<Timestamp> deleted_at;

    [[nodiscard]] bool is_deleted() const noexcept { return deleted_at.has_value(); }

    bool operator==(const HistoryRecord&) const = default;
};

/**
 * Content-derived record id: BLAKE2b-128 over host, start time, session,
 * cwd and command. The same command run twice gets two ids because the
 * start times differ.
 */
[[nodiscard]] Uuid derive_record_id(const Uuid& host_id,
                                    Timestamp timestamp,
                                    std::string_view session,
                                    std::string_view cwd,
                                    std::string_view command);

[[nodiscard]] HistoryRecord make_record(const Uuid& host_id,
                                        Timestamp timestamp,
                                        std::string command,
                                        std::string cwd,
                                        std::string session,
                                        int64_t exit_code = 0,
                                        int64_t duration = 0);

/**
 * Copy of `record` tombstoned at `at`, with its content discarded.
 */
[[nodiscard]] HistoryRecord tombstone(const HistoryRecord& record, Timestamp at);

/**
 * Server-visible id of the envelope carrying this record.
 *
 * Live records use their own id. A tombstone travels as a separate
 * immutable envelope whose id is derived from (record id, deleted_at),
 * so re-pushing it is idempotent and two independent deletions of the
 * same record both reach every peer.
 */
[[nodiscard]] std::string envelope_id_for(const HistoryRecord& record);

/**
 * Canonical binary form used as encryption plaintext.
 *
 * Layout (big-endian): format u8, id[16], host_id[16], timestamp i64,
 * duration i64, exit_code i64, command/cwd/session as u32 length + bytes,
 * deleted flag u8, then deleted_at i64 when the flag is 1.
 */
[[nodiscard]] std::vector<uint8_t> encode_record(const HistoryRecord& record);

/**
 * Parse the canonical form. Any truncation, unknown format byte, bad
 * flag or trailing data is a DecodeError.
 */
[[nodiscard]] Result<HistoryRecord, Error> decode_record(std::span<const uint8_t> bytes);

} // namespace spool
