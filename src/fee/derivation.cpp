#include "fee/derivation.hpp"

#include <utility>
#include <vector>

#include "primitives/perbill.hpp"

namespace weightfee::fee {

std::optional<RationalCoefficient> CoefficientFromRatio(primitives::Balance numerator,
                                                        primitives::Balance denominator,
                                                        std::string* error) {
  if (denominator == 0) {
    if (error) *error = "coefficient denominator must be non-zero";
    return std::nullopt;
  }
  RationalCoefficient coefficient;
  coefficient.integer = numerator / denominator;
  coefficient.fraction =
      primitives::Perbill::FromRationalFloor(numerator % denominator, denominator);
  coefficient.negative = false;
  return coefficient;
}

std::optional<FeePolynomial> DeriveLinearPolynomial(primitives::Weight reference_weight,
                                                    primitives::Balance target_fee,
                                                    std::string* error) {
  if (reference_weight == 0) {
    if (error) *error = "reference weight must be non-zero";
    return std::nullopt;
  }
  auto coefficient = CoefficientFromRatio(target_fee, reference_weight, error);
  if (!coefficient) {
    return std::nullopt;
  }
  std::vector<PolynomialTerm> terms{PolynomialTerm{1, *coefficient}};
  return FeePolynomial::Create(std::move(terms), error);
}

}  // namespace weightfee::fee
