#include "primitives/perbill.hpp"

namespace weightfee::primitives {

namespace {

// Next decimal digit of remainder / denominator: replaces |*remainder| with
// (10 * remainder) mod denominator and returns floor(10 * remainder /
// denominator). Requires remainder < denominator; nothing exceeds 128 bits.
std::uint32_t NextDecimalDigit(Balance* remainder, Balance denominator) {
  const Balance step = *remainder;
  const Balance headroom = denominator - step;
  Balance acc = 0;
  std::uint32_t digit = 0;
  for (int i = 0; i < 10; ++i) {
    if (acc >= headroom) {
      acc -= headroom;
      ++digit;
    } else {
      acc += step;
    }
  }
  *remainder = acc;
  return digit;
}

}  // namespace

Perbill Perbill::FromRationalFloor(Balance numerator, Balance denominator) {
  if (denominator == 0) {
    return Zero();
  }
  if (numerator >= denominator) {
    return One();
  }
  const Balance scale = kPerbillDenominator;
  if (numerator <= kMaxBalance / scale) {
    return Perbill(static_cast<std::uint32_t>(numerator * scale / denominator));
  }
  // Nine digits of long division keep the result an exact floor for
  // operands near 2^128.
  Balance remainder = numerator;
  std::uint32_t parts = 0;
  for (int i = 0; i < 9; ++i) {
    parts = parts * 10 + NextDecimalDigit(&remainder, denominator);
  }
  return Perbill(parts);
}

Balance Perbill::MulFloor(Balance value) const {
  const Balance scale = kPerbillDenominator;
  const Balance quotient = value / scale;
  const Balance remainder = value % scale;
  // remainder < 10^9 and parts_ <= 10^9, so the product stays below 10^18.
  const Balance high = SaturatingMul(quotient, parts_);
  const Balance low = remainder * parts_ / scale;
  return SaturatingAdd(high, low);
}

}  // namespace weightfee::primitives
