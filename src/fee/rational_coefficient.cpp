#include "fee/rational_coefficient.hpp"

namespace weightfee::fee {

primitives::Balance RationalCoefficient::ApplyMagnitude(primitives::Balance value) const {
  const auto integer_part = primitives::SaturatingMul(value, integer);
  const auto fraction_part = fraction.MulFloor(value);
  return primitives::SaturatingAdd(integer_part, fraction_part);
}

bool ValidateCoefficient(const RationalCoefficient& coefficient, std::string* error) {
  if (!coefficient.fraction.IsProperFraction()) {
    if (error) {
      *error = "coefficient fraction " + std::to_string(coefficient.fraction.Parts()) +
               " must be below " + std::to_string(primitives::kPerbillDenominator);
    }
    return false;
  }
  return true;
}

std::string DescribeCoefficient(const RationalCoefficient& coefficient) {
  std::string out;
  if (coefficient.negative) {
    out.push_back('-');
  }
  out += primitives::FormatBalance(coefficient.integer);
  out += " + ";
  out += std::to_string(coefficient.fraction.Parts());
  out += "/";
  out += std::to_string(primitives::kPerbillDenominator);
  return out;
}

}  // namespace weightfee::fee
