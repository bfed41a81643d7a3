#pragma once

#include "umpcore/crypto_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace umpcore::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes HmacSha256(const Bytes& key, const Bytes& data);
bool ConstantTimeEquals(const Bytes& lhs, const Bytes& rhs) noexcept;

// One-shot AES-CTR. Key length picks AES-128/192/256; IV must be 16 bytes.
Bytes AesCtrTransform(const Bytes& key, const Bytes& iv, const Bytes& data);

/**
 * AES-CTR keystream that keeps its position between calls, so a payload
 * delivered in several chunks decrypts exactly as if it arrived in one piece.
 */
class CtrStream {
public:
    CtrStream(const Bytes& key, const Bytes& iv);

    CtrStream(CtrStream&&) noexcept = default;
    CtrStream& operator=(CtrStream&&) noexcept = default;
    CtrStream(const CtrStream&) = delete;
    CtrStream& operator=(const CtrStream&) = delete;

    Bytes Update(const Bytes& data);
    Bytes Update(const std::uint8_t* data, std::size_t len);

    // Keystream bytes consumed so far.
    std::uint64_t Position() const noexcept { return position_; }

private:
    detail::UniqueCipherCtx ctx_;
    std::uint64_t position_ = 0;
};

}  // namespace umpcore::crypto
