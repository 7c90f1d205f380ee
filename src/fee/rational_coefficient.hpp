#pragma once

#include <string>

#include "primitives/balance.hpp"
#include "primitives/perbill.hpp"

namespace weightfee::fee {

// Signed fixed-point price per unit of weight: integer + fraction / 10^9.
struct RationalCoefficient {
  primitives::Balance integer{0};
  primitives::Perbill fraction{};
  bool negative{false};

  // floor(value * (integer + fraction)) ignoring the sign, saturating.
  primitives::Balance ApplyMagnitude(primitives::Balance value) const;

  bool operator==(const RationalCoefficient& other) const {
    return integer == other.integer && fraction == other.fraction && negative == other.negative;
  }
};

// A coefficient fraction must be strictly below one.
bool ValidateCoefficient(const RationalCoefficient& coefficient, std::string* error);

// Human-readable "integer + parts/1000000000" with a leading '-' when negative.
std::string DescribeCoefficient(const RationalCoefficient& coefficient);

}  // namespace weightfee::fee
