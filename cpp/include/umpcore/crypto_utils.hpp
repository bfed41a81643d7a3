#pragma once

#include <openssl/evp.h>
#include <cstddef>
#include <memory>

namespace umpcore::crypto::detail {

// RAII wrappers for OpenSSL resources to prevent memory leaks
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;

// AES-CTR cipher for a raw key of 16, 24 or 32 bytes, nullptr otherwise.
inline const EVP_CIPHER* AesCtrForKeyLength(std::size_t key_len) noexcept {
    switch (key_len) {
        case 16:
            return EVP_aes_128_ctr();
        case 24:
            return EVP_aes_192_ctr();
        case 32:
            return EVP_aes_256_ctr();
        default:
            return nullptr;
    }
}

}  // namespace umpcore::crypto::detail
