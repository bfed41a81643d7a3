#include "umpcore/base64.hpp"

#include <array>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace umpcore::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    // URL-safe alphabet, as Onesie keys are usually published.
    table[static_cast<std::uint8_t>('-')] = 62;
    table[static_cast<std::uint8_t>('_')] = 63;
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
        i += 3;
    }
    std::size_t rest = data.size() - i;
    if (rest > 0) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        if (rest == 2) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(rest == 2 ? kEncTable[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::vector<std::uint8_t> Decode(const std::string& input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3);

    std::uint32_t val = 0;
    int valb = -8;
    std::size_t symbols = 0;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            break;
        }
        std::uint8_t decoded = kDecTable[c];
        if (decoded == 0xFF) {
            success = false;
            break;
        }
        ++symbols;
        val = ((val << 6) | decoded) & 0xFFFFFFu;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    // A lone trailing symbol carries fewer than eight bits.
    if (symbols % 4 == 1) {
        success = false;
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

std::vector<std::uint8_t> DecodeOrThrow(const std::string& input, const std::string& what) {
    bool ok = false;
    std::vector<std::uint8_t> out = Decode(input, &ok);
    if (!ok) {
        throw std::runtime_error("Invalid base64 for " + what);
    }
    return out;
}

}  // namespace umpcore::base64
