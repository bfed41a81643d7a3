#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace umpcore {

std::vector<std::uint8_t> ReadFile(const std::string& path);
void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data);

}  // namespace umpcore
