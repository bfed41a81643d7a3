#pragma once

#include "umpcore/schema.hpp"

#include <cstdint>
#include <vector>

namespace umpcore::onesie {

using Bytes = std::vector<std::uint8_t>;

// The 32-byte Onesie key split into its AES-CTR and HMAC-SHA256 halves.
struct KeyParts {
    Bytes aes_key;
    Bytes hmac_key;
};

// Throws UmpError(kInvalidKeyLength) unless key is exactly 32 bytes.
KeyParts SplitKey(const Bytes& key);

struct SealedPayload {
    Bytes ciphertext;
    Bytes iv;
    Bytes hmac;
};

// AES-CTR under a fresh random IV, then HMAC-SHA256 over ciphertext || iv.
SealedPayload Seal(const Bytes& key, const Bytes& plaintext);
// Seal for an outgoing request body, gzip-compressing the plaintext first when asked.
SealedPayload SealRequest(const Bytes& key, const Bytes& plaintext, bool compress);

// Verifies the HMAC in constant time before decrypting. Throws
// UmpError(kAuthenticationFailed) on mismatch; no plaintext is produced.
Bytes Open(const Bytes& key, const Bytes& ciphertext, const Bytes& iv, const Bytes& hmac);

// Brotli for OnesieCompression::kBrotli, gzip for every other value.
Bytes Decompress(const Bytes& data, std::uint32_t compression_type);

// Opens and decompresses an ONESIE_DATA payload under its header's crypto params.
Bytes OpenPayload(const Bytes& key, const OnesieHeader& header, const Bytes& payload);

// OpenPayload plus wrapper decoding; throws UmpError(kUpstreamError) with the
// wrapper body as detail unless proxy status is OK and HTTP status is 200.
InnertubeResponse OpenPlayerResponse(const Bytes& key,
                                     const OnesieHeader& header,
                                     const Bytes& payload,
                                     const SchemaDecoder& decoder);

}  // namespace umpcore::onesie
