#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace weightfee::primitives {

// Count of the smallest indivisible currency unit. 128 bits so that the total
// supply of any realistic network fits without overflow.
using Balance = unsigned __int128;

// Normalized resource consumption of one operation.
using Weight = std::uint64_t;

inline constexpr Balance kMaxBalance = ~static_cast<Balance>(0);
inline constexpr Weight kMaxWeight = ~static_cast<Weight>(0);

inline constexpr Balance SaturatingAdd(Balance a, Balance b) noexcept {
  return a > kMaxBalance - b ? kMaxBalance : a + b;
}

inline constexpr Balance SaturatingSub(Balance a, Balance b) noexcept {
  return b > a ? 0 : a - b;
}

inline constexpr Balance SaturatingMul(Balance a, Balance b) noexcept {
  if (a == 0 || b == 0) {
    return 0;
  }
  if (a > kMaxBalance / b) {
    return kMaxBalance;
  }
  return a * b;
}

// Exponents are small and bounded by callers, so this is a plain loop.
inline constexpr Balance SaturatingPow(Balance base, std::uint32_t exponent) noexcept {
  Balance result = 1;
  for (std::uint32_t i = 0; i < exponent; ++i) {
    result = SaturatingMul(result, base);
    if (result == kMaxBalance || result == 0) {
      break;
    }
  }
  return result;
}

// Decimal rendering; 128-bit values do not fit any stream or JSON integer.
std::string FormatBalance(Balance value);

// Strict decimal parse. Digit separators ('_' and '\'') are accepted between
// digits. Returns nullopt on empty input, stray characters or overflow.
std::optional<Balance> ParseBalance(std::string_view text);
std::optional<Weight> ParseWeight(std::string_view text);

}  // namespace weightfee::primitives
