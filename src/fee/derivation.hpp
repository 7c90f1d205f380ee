#pragma once

#include <optional>
#include <string>

#include "fee/fee_polynomial.hpp"
#include "fee/rational_coefficient.hpp"
#include "primitives/balance.hpp"

namespace weightfee::fee {

// Price per unit of weight equal to |numerator| / |denominator|, with the
// remainder kept as a floored fraction of a billion. Fails when the
// denominator is zero.
std::optional<RationalCoefficient> CoefficientFromRatio(primitives::Balance numerator,
                                                        primitives::Balance denominator,
                                                        std::string* error);

// Single linear term calibrated against |target_fee| at |reference_weight|.
// Calc(reference_weight) never exceeds the target and falls short of it by
// less than 1 + reference_weight / 10^9 units; at an arbitrary weight w the
// shortfall against the real-valued fee is below 1 + w / 10^9 units.
std::optional<FeePolynomial> DeriveLinearPolynomial(primitives::Weight reference_weight,
                                                    primitives::Balance target_fee,
                                                    std::string* error);

}  // namespace weightfee::fee
