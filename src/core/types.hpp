#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <span>

namespace spool {

/**
 * Uuid - 128-bit identifier.
 *
 * Used for host identifiers (random) and for content-derived record ids
 * (hash output formatted the same way).
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random version 4 UUID from the libsodium CSPRNG.
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Build from the first 16 bytes of a digest. Returns nullopt when the
     * input is shorter than 16 bytes.
     */
    [[nodiscard]] static std::optional<Uuid> from_bytes(std::span<const uint8_t> bytes);

    /**
     * Parse hyphenated or plain 32-digit hex.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - Nanoseconds since the Unix epoch.
 *
 * Shell history needs sub-millisecond resolution: two commands started
 * in the same millisecond on one host must still order.
 */
class Timestamp {
public:
    using Duration = std::chrono::nanoseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : nanos_(0) {}
    explicit constexpr Timestamp(int64_t nanos) noexcept : nanos_(nanos) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t nanos() const noexcept {
        return nanos_;
    }

    /**
     * Format as ISO 8601 with millisecond precision.
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(nanos_ + d.count());
    }

private:
    int64_t nanos_;
};

} // namespace spool

namespace std {
    template<>
    struct hash<spool::Uuid> {
        size_t operator()(const spool::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
