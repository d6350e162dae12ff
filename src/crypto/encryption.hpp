#pragma once

#include "core/history.hpp"
#include "core/result.hpp"
#include "crypto/keys.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace spool::crypto {

/**
 * Scheme versions. v1 is XChaCha20-Poly1305 (IETF) over the canonical
 * record encoding, with the version and envelope id as associated data.
 */
constexpr uint32_t SCHEME_V1 = 1;
constexpr uint32_t CURRENT_SCHEME = SCHEME_V1;

constexpr size_t V1_NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
constexpr size_t V1_TAG_SIZE = crypto_aead_xchacha20poly1305_ietf_ABYTES;

/**
 * EncryptedPayload - What encrypt() produces and decrypt() consumes.
 *
 * The tag is appended to the ciphertext.
 */
struct EncryptedPayload {
    std::string envelope_id;
    uint32_t version{CURRENT_SCHEME};
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;
};

/**
 * Encrypt a record with a fresh random nonce.
 */
[[nodiscard]] Result<EncryptedPayload, Error> encrypt(const SyncKey& key,
                                                      const HistoryRecord& record);

/**
 * Verify and decrypt.
 *
 * UnsupportedVersion for unknown scheme versions, AuthenticationFailed
 * for any tag failure (tampering, wrong key, corruption), DecodeError
 * when the verified plaintext is not a record belonging to this envelope.
 */
[[nodiscard]] Result<HistoryRecord, Error> decrypt(const SyncKey& key,
                                                   const EncryptedPayload& payload);

} // namespace spool::crypto
