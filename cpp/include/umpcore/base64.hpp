#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace umpcore::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);
// Accepts the standard and URL-safe alphabets, with or without padding.
// Whitespace is skipped. On invalid input returns empty and clears *ok.
std::vector<std::uint8_t> Decode(const std::string& input, bool* ok = nullptr);
// Decode that throws std::runtime_error naming what was being decoded.
std::vector<std::uint8_t> DecodeOrThrow(const std::string& input, const std::string& what);

}  // namespace umpcore::base64
