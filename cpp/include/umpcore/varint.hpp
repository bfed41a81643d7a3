#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace umpcore::varint {

using Bytes = std::vector<std::uint8_t>;

struct Decoded {
    std::uint32_t value = 0;
    std::size_t size = 0;
};

// Leading set bits of the first byte, capped at 4, plus one.
std::size_t SizeFromFirstByte(std::uint8_t first) noexcept;

// Throws UmpError(kTruncatedInput) when len is shorter than the encoded size.
Decoded Decode(const std::uint8_t* data, std::size_t len);
std::optional<Decoded> TryDecode(const std::uint8_t* data, std::size_t len) noexcept;

std::size_t EncodedSize(std::uint32_t value) noexcept;
Bytes Encode(std::uint32_t value);
// Five-byte form; the low nibble of the first byte is left zero.
Bytes EncodeFixed5(std::uint32_t value);
void AppendEncoded(Bytes& out, std::uint32_t value);

}  // namespace umpcore::varint
