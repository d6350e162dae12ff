#include "core/history.hpp"

#include <sodium.h>
#include <array>

namespace spool {

namespace {

constexpr uint8_t RECORD_FORMAT = 1;
constexpr size_t ID_DIGEST_SIZE = 16;
constexpr std::string_view RECORD_ID_CONTEXT = "spool.record.id";
constexpr std::string_view TOMBSTONE_ID_CONTEXT = "spool.record.tombstone";

class ByteWriter {
public:
    void u8(uint8_t v) { out_.push_back(v); }

    void i64(int64_t value) {
        auto v = static_cast<uint64_t>(value);
        for (int shift = 56; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
        }
    }

    void raw(std::span<const uint8_t> bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void str(std::string_view s) {
        u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    [[nodiscard]] std::vector<uint8_t> take() { return std::move(out_); }

private:
    std::vector<uint8_t> out_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> in) : in_(in) {}

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = in_[pos_++];
        return true;
    }

    bool i64(int64_t& value) {
        if (remaining() < 8) return false;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | in_[pos_++];
        }
        value = static_cast<int64_t>(v);
        return true;
    }

    bool u32(uint32_t& value) {
        if (remaining() < 4) return false;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v = (v << 8) | in_[pos_++];
        }
        value = v;
        return true;
    }

    bool uuid(Uuid& out) {
        if (remaining() < Uuid::BYTE_SIZE) return false;
        auto parsed = Uuid::from_bytes(in_.subspan(pos_, Uuid::BYTE_SIZE));
        pos_ += Uuid::BYTE_SIZE;
        out = *parsed;
        return true;
    }

    bool str(std::string& out) {
        uint32_t len = 0;
        if (!u32(len) || remaining() < len) return false;
        out.assign(reinterpret_cast<const char*>(in_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    [[nodiscard]] size_t remaining() const { return in_.size() - pos_; }

private:
    std::span<const uint8_t> in_;
    size_t pos_ = 0;
};

Uuid digest_to_uuid(crypto_generichash_state& state) {
    std::array<uint8_t, ID_DIGEST_SIZE> digest{};
    crypto_generichash_final(&state, digest.data(), digest.size());
    return *Uuid::from_bytes(digest);
}

void hash_update(crypto_generichash_state& state, std::span<const uint8_t> bytes) {
    crypto_generichash_update(&state, bytes.data(), bytes.size());
}

} // namespace

Uuid derive_record_id(const Uuid& host_id,
                      Timestamp timestamp,
                      std::string_view session,
                      std::string_view cwd,
                      std::string_view command) {
    // Length prefixes keep ("ab", "c") and ("a", "bc") apart.
    ByteWriter w;
    w.str(RECORD_ID_CONTEXT);
    w.raw(host_id.bytes());
    w.i64(timestamp.nanos());
    w.str(session);
    w.str(cwd);
    w.str(command);
    const auto material = w.take();

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, ID_DIGEST_SIZE);
    hash_update(state, material);
    return digest_to_uuid(state);
}

HistoryRecord make_record(const Uuid& host_id,
                          Timestamp timestamp,
                          std::string command,
                          std::string cwd,
                          std::string session,
                          int64_t exit_code,
                          int64_t duration) {
    HistoryRecord record{
        .id = derive_record_id(host_id, timestamp, session, cwd, command),
        .host_id = host_id,
        .timestamp = timestamp,
        .duration = duration,
        .exit_code = exit_code,
        .command = std::move(command),
        .cwd = std::move(cwd),
        .session = std::move(session),
        .deleted_at = std::nullopt
    };
    return record;
}

HistoryRecord tombstone(const HistoryRecord& record, Timestamp at) {
    HistoryRecord dead = record;
    dead.command.clear();
    dead.cwd.clear();
    dead.deleted_at = at;
    return dead;
}

std::string envelope_id_for(const HistoryRecord& record) {
    if (!record.deleted_at) {
        return record.id.to_string();
    }

    ByteWriter w;
    w.str(TOMBSTONE_ID_CONTEXT);
    w.raw(record.id.bytes());
    w.i64(record.deleted_at->nanos());
    const auto material = w.take();

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, ID_DIGEST_SIZE);
    hash_update(state, material);
    return digest_to_uuid(state).to_string();
}

std::vector<uint8_t> encode_record(const HistoryRecord& record) {
    ByteWriter w;
    w.u8(RECORD_FORMAT);
    w.raw(record.id.bytes());
    w.raw(record.host_id.bytes());
    w.i64(record.timestamp.nanos());
    w.i64(record.duration);
    w.i64(record.exit_code);
    w.str(record.command);
    w.str(record.cwd);
    w.str(record.session);
    if (record.deleted_at) {
        w.u8(1);
        w.i64(record.deleted_at->nanos());
    } else {
        w.u8(0);
    }
    return w.take();
}

Result<HistoryRecord, Error> decode_record(std::span<const uint8_t> bytes) {
    ByteReader r(bytes);
    HistoryRecord record;

    uint8_t format = 0;
    if (!r.u8(format)) {
        return fail<HistoryRecord>(ErrorCode::DecodeError, "record is empty");
    }
    if (format != RECORD_FORMAT) {
        return fail<HistoryRecord>(ErrorCode::DecodeError,
                                   "unknown record format " + std::to_string(format));
    }

    int64_t timestamp = 0;
    bool ok = r.uuid(record.id)
        && r.uuid(record.host_id)
        && r.i64(timestamp)
        && r.i64(record.duration)
        && r.i64(record.exit_code)
        && r.str(record.command)
        && r.str(record.cwd)
        && r.str(record.session);
    if (!ok) {
        return fail<HistoryRecord>(ErrorCode::DecodeError, "record is truncated");
    }
    record.timestamp = Timestamp(timestamp);

    uint8_t deleted = 0;
    if (!r.u8(deleted) || deleted > 1) {
        return fail<HistoryRecord>(ErrorCode::DecodeError, "bad tombstone flag");
    }
    if (deleted == 1) {
        int64_t deleted_at = 0;
        if (!r.i64(deleted_at)) {
            return fail<HistoryRecord>(ErrorCode::DecodeError, "tombstone is truncated");
        }
        record.deleted_at = Timestamp(deleted_at);
    }

    if (r.remaining() != 0) {
        return fail<HistoryRecord>(ErrorCode::DecodeError,
                                   std::to_string(r.remaining()) + " trailing bytes after record");
    }

    return Result<HistoryRecord, Error>::ok(std::move(record));
}

} // namespace spool
