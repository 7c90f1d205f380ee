#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fee/rational_coefficient.hpp"
#include "primitives/balance.hpp"

namespace weightfee::fee {

// Degree and term count bounds keep evaluation cost independent of input.
inline constexpr std::uint8_t kMaxTermDegree = 3;
inline constexpr std::size_t kMaxPolynomialTerms = 8;

struct PolynomialTerm {
  std::uint8_t degree{0};
  RationalCoefficient coefficient{};

  bool operator==(const PolynomialTerm& other) const {
    return degree == other.degree && coefficient == other.coefficient;
  }
};

// Validated weight-to-fee polynomial. Instances can only be obtained through
// Create(), so a malformed policy never reaches Calc().
class FeePolynomial {
 public:
  static std::optional<FeePolynomial> Create(std::vector<PolynomialTerm> terms,
                                             std::string* error);

  // Signed sum of all terms at |weight|, floored at zero and clamped to
  // kMaxBalance. Each term saturates on its own; the sum itself is exact.
  // Never fails.
  primitives::Balance Calc(primitives::Weight weight) const;

  const std::vector<PolynomialTerm>& Terms() const { return terms_; }
  std::uint8_t MaxDegree() const;

 private:
  explicit FeePolynomial(std::vector<PolynomialTerm> terms) : terms_(std::move(terms)) {}

  std::vector<PolynomialTerm> terms_;
};

// Value of one term without its sign.
primitives::Balance EvaluateTermMagnitude(const PolynomialTerm& term, primitives::Weight weight);

}  // namespace weightfee::fee
