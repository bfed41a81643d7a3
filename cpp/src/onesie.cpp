#include "umpcore/onesie.hpp"

#include "umpcore/compression.hpp"
#include "umpcore/constants.hpp"
#include "umpcore/crypto.hpp"
#include "umpcore/errors.hpp"

#include <string>

namespace umpcore::onesie {

namespace {

Bytes MacInput(const Bytes& ciphertext, const Bytes& iv) {
    Bytes data;
    data.reserve(ciphertext.size() + iv.size());
    data.insert(data.end(), ciphertext.begin(), ciphertext.end());
    data.insert(data.end(), iv.begin(), iv.end());
    return data;
}

std::string MissingFields(const std::optional<CryptoParams>& params) {
    if (!params) {
        return "crypto_params";
    }
    std::string missing;
    auto add = [&missing](const char* name) {
        if (!missing.empty()) {
            missing += ", ";
        }
        missing += name;
    };
    if (!params->hmac) add("hmac");
    if (!params->iv) add("iv");
    if (!params->compression_type) add("compression_type");
    return missing;
}

}  // namespace

KeyParts SplitKey(const Bytes& key) {
    if (key.size() != constants::kOnesieKeyLen) {
        throw UmpError(ErrorKind::kInvalidKeyLength,
                       "Onesie key must be 32 bytes, got " + std::to_string(key.size()));
    }
    KeyParts parts;
    parts.aes_key.assign(key.begin(), key.begin() + constants::kOnesieAesKeyLen);
    parts.hmac_key.assign(key.begin() + constants::kOnesieAesKeyLen, key.end());
    return parts;
}

SealedPayload Seal(const Bytes& key, const Bytes& plaintext) {
    KeyParts parts = SplitKey(key);
    SealedPayload sealed;
    sealed.iv = crypto::RandomBytes(constants::kOnesieIvLen);
    sealed.ciphertext = crypto::AesCtrTransform(parts.aes_key, sealed.iv, plaintext);
    sealed.hmac = crypto::HmacSha256(parts.hmac_key, MacInput(sealed.ciphertext, sealed.iv));
    return sealed;
}

SealedPayload SealRequest(const Bytes& key, const Bytes& plaintext, bool compress) {
    if (!compress) {
        return Seal(key, plaintext);
    }
    return Seal(key, compression::GzipCompress(plaintext));
}

Bytes Open(const Bytes& key, const Bytes& ciphertext, const Bytes& iv, const Bytes& hmac) {
    KeyParts parts = SplitKey(key);
    if (iv.size() != constants::kOnesieIvLen) {
        throw UmpError(ErrorKind::kMissingCryptoParams,
                       "Onesie IV must be 16 bytes, got " + std::to_string(iv.size()));
    }
    Bytes expected = crypto::HmacSha256(parts.hmac_key, MacInput(ciphertext, iv));
    if (!crypto::ConstantTimeEquals(expected, hmac)) {
        throw UmpError(ErrorKind::kAuthenticationFailed, "Onesie HMAC verification failed");
    }
    return crypto::AesCtrTransform(parts.aes_key, iv, ciphertext);
}

Bytes Decompress(const Bytes& data, std::uint32_t compression_type) {
    if (compression_type == static_cast<std::uint32_t>(OnesieCompression::kBrotli)) {
        return compression::BrotliDecompress(data);
    }
    return compression::GzipDecompress(data);
}

Bytes OpenPayload(const Bytes& key, const OnesieHeader& header, const Bytes& payload) {
    if (!header.crypto_params || !header.crypto_params->Complete()) {
        throw UmpError(ErrorKind::kMissingCryptoParams,
                       OnesieHeaderTypeName(header.type) + " header lacks " + MissingFields(header.crypto_params));
    }
    const CryptoParams& params = *header.crypto_params;
    Bytes plaintext = Open(key, payload, *params.iv, *params.hmac);
    return Decompress(plaintext, *params.compression_type);
}

InnertubeResponse OpenPlayerResponse(const Bytes& key,
                                     const OnesieHeader& header,
                                     const Bytes& payload,
                                     const SchemaDecoder& decoder) {
    InnertubeResponse response = decoder.DecodeInnertubeResponse(OpenPayload(key, header, payload));
    if (!response.Ok()) {
        throw UmpError(ErrorKind::kUpstreamError,
                       "Onesie player response failed (proxy status " + std::to_string(response.proxy_status)
                           + ", HTTP " + std::to_string(response.http_status) + "): "
                           + std::string(response.body.begin(), response.body.end()));
    }
    return response;
}

}  // namespace umpcore::onesie
