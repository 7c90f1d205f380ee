#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace weightfee::util {

// Lowercase, two characters per byte, no prefix.
std::string HexEncode(std::span<const std::uint8_t> data);

}  // namespace weightfee::util
