#pragma once

#include <cstdint>

#include "primitives/balance.hpp"

namespace weightfee::primitives {

inline constexpr std::uint32_t kPerbillDenominator = 1'000'000'000;

// Fraction in parts per billion, [0, 1]. The raw constructor does not clamp
// so that out-of-range configuration input can be detected by IsValid().
class Perbill {
 public:
  constexpr Perbill() = default;
  constexpr explicit Perbill(std::uint32_t parts) : parts_(parts) {}

  static constexpr Perbill Zero() { return Perbill(0); }
  static constexpr Perbill One() { return Perbill(kPerbillDenominator); }
  static constexpr Perbill FromPercent(std::uint32_t percent) {
    return Perbill(percent >= 100 ? kPerbillDenominator : percent * 10'000'000u);
  }
  // floor(numerator * 10^9 / denominator), saturating at one. The result is a
  // proper fraction whenever numerator < denominator. A zero denominator
  // yields zero.
  static Perbill FromRationalFloor(Balance numerator, Balance denominator);

  constexpr std::uint32_t Parts() const { return parts_; }
  constexpr bool IsValid() const { return parts_ <= kPerbillDenominator; }
  // Strictly below one, which is what a coefficient fraction requires.
  constexpr bool IsProperFraction() const { return parts_ < kPerbillDenominator; }

  // floor(value * parts / 10^9) without a wider intermediate type. The only
  // product that can overflow is the quotient term, which saturates.
  Balance MulFloor(Balance value) const;

  constexpr bool operator==(const Perbill& other) const { return parts_ == other.parts_; }
  constexpr bool operator!=(const Perbill& other) const { return parts_ != other.parts_; }

 private:
  std::uint32_t parts_{0};
};

}  // namespace weightfee::primitives
