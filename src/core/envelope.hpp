#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace spool {

/**
 * Envelope - The server-visible form of a history record.
 *
 * Everything except `id`, `host_token` and `global_seq` is opaque to the
 * server. `global_seq` is zero until the server assigns it on insert.
 */
struct Envelope {
    std::string id;
    std::string host_token;
    std::vector<uint8_t> ciphertext;    // AEAD output, tag included
    std::vector<uint8_t> nonce;
    uint32_t version{0};
    int64_t global_seq{0};

    bool operator==(const Envelope&) const = default;
};

} // namespace spool
