#include "umpcore/crypto.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <string>

namespace umpcore::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw UmpError(ErrorKind::kCryptoFailure, message);
    }
}

const EVP_CIPHER* CipherForKey(const Bytes& key) {
    const EVP_CIPHER* cipher = detail::AesCtrForKeyLength(key.size());
    if (!cipher) {
        throw UmpError(ErrorKind::kInvalidKeyLength,
                       "AES-CTR expects a 16, 24 or 32-byte key, got " + std::to_string(key.size()));
    }
    return cipher;
}

void EnsureIv(const Bytes& iv) {
    if (iv.size() != constants::kOnesieIvLen) {
        throw UmpError(ErrorKind::kMissingCryptoParams,
                       "AES-CTR expects 16-byte IV, got " + std::to_string(iv.size()));
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes HmacSha256(const Bytes& key, const Bytes& data) {
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(),
              data.size(), out.data(), &out_len)) {
        throw UmpError(ErrorKind::kCryptoFailure, "HMAC-SHA256 failed");
    }
    out.resize(out_len);
    return out;
}

bool ConstantTimeEquals(const Bytes& lhs, const Bytes& rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (lhs.empty()) {
        return true;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

Bytes AesCtrTransform(const Bytes& key, const Bytes& iv, const Bytes& data) {
    CtrStream stream(key, iv);
    return stream.Update(data);
}

CtrStream::CtrStream(const Bytes& key, const Bytes& iv)
    : ctx_(EVP_CIPHER_CTX_new()) {
    const EVP_CIPHER* cipher = CipherForKey(key);
    EnsureIv(iv);
    Ensure(ctx_ != nullptr, "AES-CTR context allocation failed");
    Ensure(EVP_EncryptInit_ex(ctx_.get(), cipher, nullptr, key.data(), iv.data()) == 1,
           "AES-CTR init failed");
}

Bytes CtrStream::Update(const Bytes& data) {
    return Update(data.data(), data.size());
}

Bytes CtrStream::Update(const std::uint8_t* data, std::size_t len) {
    Bytes out(len);
    std::size_t offset = 0;
    // EVP_EncryptUpdate takes an int length
    constexpr std::size_t kMaxStep = static_cast<std::size_t>(std::numeric_limits<int>::max()) & ~std::size_t{15};
    while (offset < len) {
        std::size_t step = std::min(len - offset, kMaxStep);
        int out_len = 0;
        Ensure(EVP_EncryptUpdate(ctx_.get(), out.data() + offset, &out_len, data + offset,
                                 static_cast<int>(step)) == 1,
               "AES-CTR update failed");
        Ensure(static_cast<std::size_t>(out_len) == step, "AES-CTR produced a short block");
        offset += step;
    }
    position_ += len;
    return out;
}

}  // namespace umpcore::crypto
