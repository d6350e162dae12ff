#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spool::crypto {

constexpr size_t SYNC_KEY_SIZE = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;
constexpr size_t KDF_SALT_SIZE = crypto_pwhash_SALTBYTES;
constexpr size_t HOST_TOKEN_SIZE = 16;

// Fixed so that every client derives the same key from the same phrase.
constexpr unsigned long long KDF_OPSLIMIT = crypto_pwhash_OPSLIMIT_INTERACTIVE;
constexpr size_t KDF_MEMLIMIT = crypto_pwhash_MEMLIMIT_INTERACTIVE;
constexpr std::array<uint8_t, KDF_SALT_SIZE> KDF_SALT = {
    's', 'p', 'o', 'o', 'l', '.', 'h', 'i', 's', 't', 'o', 'r', 'y', '.', 'v', '1'
};

/**
 * SyncKey - The account-wide symmetric key. Never leaves the client.
 */
using SyncKey = std::array<uint8_t, SYNC_KEY_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return fail(ErrorCode::KeyDerivationFailed, "Failed to initialize libsodium");
    }
    return Result<void, Error>::ok();
}

/**
 * Derive the sync key from a user-chosen phrase with Argon2id.
 */
[[nodiscard]] inline Result<SyncKey, Error> derive_key(const std::string& phrase) {
    if (phrase.empty()) {
        return fail<SyncKey>(ErrorCode::KeyDerivationFailed, "Secret phrase is empty");
    }

    SyncKey key;
    int rc = crypto_pwhash(
        key.data(), key.size(),
        phrase.c_str(), phrase.size(),
        KDF_SALT.data(),
        KDF_OPSLIMIT,
        KDF_MEMLIMIT,
        crypto_pwhash_ALG_ARGON2ID13
    );
    if (rc != 0) {
        return fail<SyncKey>(ErrorCode::KeyDerivationFailed,
                             "Key derivation failed (out of memory?)");
    }
    return Result<SyncKey, Error>::ok(key);
}

/**
 * Generate a random key (for accounts set up without a phrase, and tests).
 */
[[nodiscard]] inline SyncKey generate_key() {
    SyncKey key;
    crypto_aead_xchacha20poly1305_ietf_keygen(key.data());
    return key;
}

[[nodiscard]] inline std::string to_base64(const std::vector<uint8_t>& data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(
        data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1);  // drop the terminator
    return out;
}

[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_base64(std::string_view b64) {
    std::vector<uint8_t> out(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    int rc = sodium_base642bin(out.data(), out.size(),
                               b64.data(), b64.size(),
                               nullptr, &out_len, nullptr,
                               sodium_base64_VARIANT_ORIGINAL);
    if (rc != 0) {
        return fail<std::vector<uint8_t>>(ErrorCode::MalformedPayload, "Invalid Base64");
    }
    out.resize(out_len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

[[nodiscard]] inline std::string to_hex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

[[nodiscard]] inline std::string key_to_base64(const SyncKey& key) {
    return to_base64(std::vector<uint8_t>(key.begin(), key.end()));
}

[[nodiscard]] inline Result<SyncKey, Error> key_from_base64(std::string_view b64) {
    auto bytes = from_base64(b64);
    if (bytes.is_err() || bytes.unwrap().size() != SYNC_KEY_SIZE) {
        return fail<SyncKey>(ErrorCode::KeyDerivationFailed, "Stored key is not a 32-byte base64 value");
    }
    SyncKey key;
    std::copy(bytes.unwrap().begin(), bytes.unwrap().end(), key.begin());
    return Result<SyncKey, Error>::ok(key);
}

/**
 * Opaque per-host token sent to the server instead of the host id.
 * Keyed BLAKE2b, so only holders of the sync key can link it to a host.
 */
[[nodiscard]] inline std::string host_token(const SyncKey& key, const Uuid& host_id) {
    std::array<uint8_t, HOST_TOKEN_SIZE> out{};
    const auto& bytes = host_id.bytes();
    crypto_generichash(out.data(), out.size(),
                       bytes.data(), bytes.size(),
                       key.data(), key.size());
    return to_hex(out);
}

[[nodiscard]] inline std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), count);
    return bytes;
}

/**
 * Unkeyed BLAKE2b-256, hex encoded.
 */
[[nodiscard]] inline std::string hash_hex(std::string_view data) {
    std::array<uint8_t, crypto_generichash_BYTES> out{};
    crypto_generichash(out.data(), out.size(),
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       nullptr, 0);
    return to_hex(out);
}

inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

} // namespace spool::crypto
