#include "crypto/encryption.hpp"

namespace spool::crypto {

namespace {

std::vector<uint8_t> associated_data(uint32_t version, const std::string& envelope_id) {
    std::vector<uint8_t> ad = {'s', 'p', 'o', 'o', 'l'};
    for (int shift = 24; shift >= 0; shift -= 8) {
        ad.push_back(static_cast<uint8_t>((version >> shift) & 0xFF));
    }
    ad.insert(ad.end(), envelope_id.begin(), envelope_id.end());
    return ad;
}

Result<std::vector<uint8_t>, Error> open_v1(const SyncKey& key,
                                            const EncryptedPayload& payload) {
    if (payload.nonce.size() != V1_NONCE_SIZE) {
        return fail<std::vector<uint8_t>>(ErrorCode::AuthenticationFailed,
            "Nonce has " + std::to_string(payload.nonce.size()) + " bytes, expected " +
            std::to_string(V1_NONCE_SIZE));
    }
    if (payload.ciphertext.size() < V1_TAG_SIZE) {
        return fail<std::vector<uint8_t>>(ErrorCode::AuthenticationFailed,
                                          "Ciphertext shorter than its tag");
    }

    const auto ad = associated_data(payload.version, payload.envelope_id);
    std::vector<uint8_t> plaintext(payload.ciphertext.size() - V1_TAG_SIZE);
    unsigned long long plaintext_len = 0;

    int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plaintext.data(), &plaintext_len,
        nullptr,
        payload.ciphertext.data(), payload.ciphertext.size(),
        ad.data(), ad.size(),
        payload.nonce.data(),
        key.data()
    );
    if (rc != 0) {
        return fail<std::vector<uint8_t>>(ErrorCode::AuthenticationFailed,
            "Decryption failed for envelope " + payload.envelope_id +
            " (wrong key or corrupted data)");
    }

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, Error>::ok(std::move(plaintext));
}

} // namespace

Result<EncryptedPayload, Error> encrypt(const SyncKey& key, const HistoryRecord& record) {
    EncryptedPayload payload;
    payload.envelope_id = envelope_id_for(record);
    payload.version = CURRENT_SCHEME;
    payload.nonce = random_bytes(V1_NONCE_SIZE);

    auto plaintext = encode_record(record);
    const auto ad = associated_data(payload.version, payload.envelope_id);

    payload.ciphertext.resize(plaintext.size() + V1_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        payload.ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        ad.data(), ad.size(),
        nullptr,
        payload.nonce.data(),
        key.data()
    );
    secure_zero(plaintext.data(), plaintext.size());

    if (rc != 0) {
        return fail<EncryptedPayload>(ErrorCode::AuthenticationFailed, "Encryption failed");
    }
    payload.ciphertext.resize(static_cast<size_t>(ciphertext_len));

    return Result<EncryptedPayload, Error>::ok(std::move(payload));
}

Result<HistoryRecord, Error> decrypt(const SyncKey& key, const EncryptedPayload& payload) {
    Result<std::vector<uint8_t>, Error> opened = [&] {
        switch (payload.version) {
            case SCHEME_V1:
                return open_v1(key, payload);
            default:
                return fail<std::vector<uint8_t>>(ErrorCode::UnsupportedVersion,
                    "Unsupported encryption scheme version " + std::to_string(payload.version));
        }
    }();
    if (opened.is_err()) {
        return Result<HistoryRecord, Error>::err(opened.unwrap_err());
    }

    auto plaintext = std::move(opened).unwrap();
    auto decoded = decode_record(plaintext);
    secure_zero(plaintext.data(), plaintext.size());
    if (decoded.is_err()) {
        return decoded;
    }

    if (envelope_id_for(decoded.unwrap()) != payload.envelope_id) {
        return fail<HistoryRecord>(ErrorCode::DecodeError,
            "Record inside envelope " + payload.envelope_id + " belongs to another envelope");
    }
    return decoded;
}

} // namespace spool::crypto
