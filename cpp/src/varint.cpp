#include "umpcore/varint.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/errors.hpp"

#include <string>

namespace umpcore::varint {

namespace {

std::uint32_t ReadU32Le(const std::uint8_t* ptr) {
    return static_cast<std::uint32_t>(ptr[0])
        | (static_cast<std::uint32_t>(ptr[1]) << 8)
        | (static_cast<std::uint32_t>(ptr[2]) << 16)
        | (static_cast<std::uint32_t>(ptr[3]) << 24);
}

std::uint32_t DecodeUnchecked(const std::uint8_t* data, std::size_t size) {
    if (size == constants::kMaxVarintLen) {
        return ReadU32Le(data + 1);
    }
    const unsigned payload_bits = static_cast<unsigned>(8 - size);
    std::uint32_t value = data[0] & ((1u << payload_bits) - 1u);
    unsigned shift = payload_bits;
    for (std::size_t i = 1; i < size; ++i) {
        value |= static_cast<std::uint32_t>(data[i]) << shift;
        shift += 8;
    }
    return value;
}

}  // namespace

std::size_t SizeFromFirstByte(std::uint8_t first) noexcept {
    std::size_t ones = 0;
    while (ones < constants::kMaxVarintLen - 1 && (first & (0x80u >> ones)) != 0) {
        ++ones;
    }
    return ones + 1;
}

std::optional<Decoded> TryDecode(const std::uint8_t* data, std::size_t len) noexcept {
    if (data == nullptr || len == 0) {
        return std::nullopt;
    }
    std::size_t size = SizeFromFirstByte(data[0]);
    if (len < size) {
        return std::nullopt;
    }
    return Decoded{DecodeUnchecked(data, size), size};
}

Decoded Decode(const std::uint8_t* data, std::size_t len) {
    if (data == nullptr || len == 0) {
        throw UmpError(ErrorKind::kTruncatedInput, "Varint input is empty");
    }
    std::size_t size = SizeFromFirstByte(data[0]);
    if (len < size) {
        throw UmpError(ErrorKind::kTruncatedInput,
                       "Varint needs " + std::to_string(size) + " bytes, have " + std::to_string(len));
    }
    return Decoded{DecodeUnchecked(data, size), size};
}

std::size_t EncodedSize(std::uint32_t value) noexcept {
    if (value < (1u << 7)) {
        return 1;
    }
    if (value < (1u << 14)) {
        return 2;
    }
    if (value < (1u << 21)) {
        return 3;
    }
    if (value < (1u << 28)) {
        return 4;
    }
    return 5;
}

void AppendEncoded(Bytes& out, std::uint32_t value) {
    const std::size_t size = EncodedSize(value);
    if (size == 5) {
        Bytes fixed = EncodeFixed5(value);
        out.insert(out.end(), fixed.begin(), fixed.end());
        return;
    }
    // size - 1 leading ones, a zero, then the low payload bits
    const unsigned payload_bits = static_cast<unsigned>(8 - size);
    const std::uint8_t prefix = static_cast<std::uint8_t>(0xFF00u >> (size - 1));
    out.push_back(static_cast<std::uint8_t>(prefix | (value & ((1u << payload_bits) - 1u))));
    value >>= payload_bits;
    for (std::size_t i = 1; i < size; ++i) {
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        value >>= 8;
    }
}

Bytes Encode(std::uint32_t value) {
    Bytes out;
    out.reserve(EncodedSize(value));
    AppendEncoded(out, value);
    return out;
}

Bytes EncodeFixed5(std::uint32_t value) {
    Bytes out(5);
    out[0] = 0xF0;
    out[1] = static_cast<std::uint8_t>(value & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[4] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    return out;
}

}  // namespace umpcore::varint
