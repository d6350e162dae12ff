#include "core/types.hpp"

#include <sodium.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace spool {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Uuid Uuid::generate() {
    Bytes bytes;
    randombytes_buf(bytes.data(), bytes.size());

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::optional<Uuid> Uuid::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() < BYTE_SIZE) {
        return std::nullopt;
    }
    Bytes out;
    std::copy_n(bytes.begin(), BYTE_SIZE, out.begin());
    return Uuid(out);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    Bytes bytes{};
    size_t nibble = 0;
    for (char c : str) {
        if (c == '-') continue;
        int v = hex_value(c);
        if (v < 0 || nibble >= BYTE_SIZE * 2) {
            return std::nullopt;
        }
        if (nibble % 2 == 0) {
            bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
        } else {
            bytes[nibble / 2] |= static_cast<uint8_t>(v);
        }
        ++nibble;
    }
    if (nibble != BYTE_SIZE * 2) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

std::string Timestamp::to_iso_string() const {
    const auto seconds = static_cast<std::time_t>(nanos_ / 1'000'000'000);
    const auto millis = (nanos_ / 1'000'000) % 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

} // namespace spool
