#include "util/hex.hpp"

#include <cstddef>

namespace weightfee::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.resize(data.size() * 2);
  for (std::size_t i = 0; i < data.size(); ++i) {
    const auto byte = data[i];
    out[i * 2] = kHexLower[(byte >> 4) & 0x0F];
    out[i * 2 + 1] = kHexLower[byte & 0x0F];
  }
  return out;
}

}  // namespace weightfee::util
