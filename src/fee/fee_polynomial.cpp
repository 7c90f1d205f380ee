#include "fee/fee_polynomial.hpp"

#include <algorithm>

namespace weightfee::fee {

namespace {

// Unsigned sum of up to kMaxPolynomialTerms balances without loss:
// carries * 2^128 + low.
struct WideSum {
  std::uint32_t carries{0};
  primitives::Balance low{0};

  void Add(primitives::Balance value) {
    low += value;
    if (low < value) {
      ++carries;
    }
  }
};

}  // namespace

std::optional<FeePolynomial> FeePolynomial::Create(std::vector<PolynomialTerm> terms,
                                                   std::string* error) {
  if (terms.empty()) {
    if (error) *error = "fee polynomial has no terms";
    return std::nullopt;
  }
  if (terms.size() > kMaxPolynomialTerms) {
    if (error) {
      *error = "fee polynomial has " + std::to_string(terms.size()) + " terms (max " +
               std::to_string(kMaxPolynomialTerms) + ")";
    }
    return std::nullopt;
  }
  for (std::size_t i = 0; i < terms.size(); ++i) {
    const auto& term = terms[i];
    if (term.degree > kMaxTermDegree) {
      if (error) {
        *error = "term " + std::to_string(i) + " has degree " + std::to_string(term.degree) +
                 " (max " + std::to_string(kMaxTermDegree) + ")";
      }
      return std::nullopt;
    }
    std::string reason;
    if (!ValidateCoefficient(term.coefficient, &reason)) {
      if (error) *error = "term " + std::to_string(i) + ": " + reason;
      return std::nullopt;
    }
  }
  return FeePolynomial(std::move(terms));
}

primitives::Balance EvaluateTermMagnitude(const PolynomialTerm& term, primitives::Weight weight) {
  const auto base = primitives::SaturatingPow(static_cast<primitives::Balance>(weight),
                                              term.degree);
  return term.coefficient.ApplyMagnitude(base);
}

primitives::Balance FeePolynomial::Calc(primitives::Weight weight) const {
  WideSum positive;
  WideSum negative;
  for (const auto& term : terms_) {
    const auto value = EvaluateTermMagnitude(term, weight);
    (term.coefficient.negative ? negative : positive).Add(value);
  }
  if (positive.carries < negative.carries ||
      (positive.carries == negative.carries && positive.low <= negative.low)) {
    return 0;
  }
  // positive - negative as a two-limb difference; anything above one limb
  // clamps.
  const std::uint32_t borrow = positive.low < negative.low ? 1 : 0;
  if (positive.carries - negative.carries - borrow > 0) {
    return primitives::kMaxBalance;
  }
  return positive.low - negative.low;
}

std::uint8_t FeePolynomial::MaxDegree() const {
  std::uint8_t max_degree = 0;
  for (const auto& term : terms_) {
    max_degree = std::max(max_degree, term.degree);
  }
  return max_degree;
}

}  // namespace weightfee::fee
