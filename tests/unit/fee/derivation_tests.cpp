#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "fee/derivation.hpp"
#include "primitives/balance.hpp"

using namespace weightfee;
using primitives::Balance;
using primitives::FormatBalance;

namespace {

constexpr Balance kUnits = 1'000'000'000'000ULL;
constexpr Balance kMillicents = kUnits / 100'000;
constexpr Balance kCents = kMillicents * 1000;
constexpr Balance kDollars = kCents * 100;
constexpr primitives::Weight kBaseWeight = 125'000'000;
constexpr primitives::Weight kMaxBlockWeight = 2'000'000'000'000ULL;

Balance AbsDiff(Balance a, Balance b) { return a > b ? a - b : b - a; }

}  // namespace

int main() {
  try {
    {
      std::string error;
      if (fee::DeriveLinearPolynomial(0, 1000, &error) || error.empty()) {
        std::cerr << "zero reference weight was accepted\n";
        return EXIT_FAILURE;
      }
      error.clear();
      if (fee::CoefficientFromRatio(1, 0, &error) || error.empty()) {
        std::cerr << "zero denominator was accepted\n";
        return EXIT_FAILURE;
      }
    }

    {
      // The base weight of a transaction costs a tenth of a cent, and a full
      // block costs sixteen dollars.
      std::string error;
      auto polynomial = fee::DeriveLinearPolynomial(kBaseWeight, kCents / 10, &error);
      if (!polynomial) {
        std::cerr << "derivation failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      const auto& term = polynomial->Terms().front();
      if (polynomial->Terms().size() != 1 || term.degree != 1 || term.coefficient.negative ||
          term.coefficient.integer != 8 || term.coefficient.fraction.Parts() != 0) {
        std::cerr << "unexpected derived coefficient\n";
        return EXIT_FAILURE;
      }
      const Balance base_fee = polynomial->Calc(kBaseWeight);
      if (AbsDiff(base_fee, kCents / 10) >= kMillicents) {
        std::cerr << "base weight fee " << FormatBalance(base_fee) << " not within a millicent\n";
        return EXIT_FAILURE;
      }
      const Balance block_fee = polynomial->Calc(kMaxBlockWeight);
      if (AbsDiff(block_fee, 16 * kDollars) >= kMillicents) {
        std::cerr << "full block fee " << FormatBalance(block_fee)
                  << " not within a millicent of 16 dollars\n";
        return EXIT_FAILURE;
      }

      // Same price written as one cent per ten base weights.
      auto ratio = fee::CoefficientFromRatio(kCents, 10 * static_cast<Balance>(kBaseWeight), &error);
      if (!ratio || !(*ratio == term.coefficient)) {
        std::cerr << "ratio derivation disagrees with the linear derivation\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Inexact ratios keep the remainder as a floored fraction.
      std::string error;
      auto polynomial = fee::DeriveLinearPolynomial(3, 10, &error);
      if (!polynomial) {
        std::cerr << "derivation failed: " << error << "\n";
        return EXIT_FAILURE;
      }
      const auto& coefficient = polynomial->Terms().front().coefficient;
      if (coefficient.integer != 3 || coefficient.fraction.Parts() != 333'333'333) {
        std::cerr << "unexpected coefficient for 10/3\n";
        return EXIT_FAILURE;
      }
      if (polynomial->Calc(3) != 9 || polynomial->Calc(3'000'000'000ULL) != 9'999'999'999ULL) {
        std::cerr << "unexpected fee for 10/3 price\n";
        return EXIT_FAILURE;
      }
    }

    {
      // Ratios whose remainder exceeds 2^98 still yield a usable coefficient.
      const Balance near_top = (static_cast<Balance>(1) << 126) + 1;
      std::string error;
      auto coefficient = fee::CoefficientFromRatio(2 * near_top - 1, near_top, &error);
      if (!coefficient || coefficient->integer != 1 ||
          coefficient->fraction.Parts() != 999'999'999) {
        std::cerr << "large ratio produced an unexpected coefficient\n";
        return EXIT_FAILURE;
      }
      const std::pair<Balance, Balance> ratios[] = {
          {primitives::kMaxBalance, near_top},
          {primitives::kMaxBalance - 1, primitives::kMaxBalance},
          {(static_cast<Balance>(3) << 125) - 1, static_cast<Balance>(1) << 125},
          {(static_cast<Balance>(1) << 99) + 7, (static_cast<Balance>(1) << 99) + 8},
      };
      for (const auto& [numerator, denominator] : ratios) {
        auto ratio = fee::CoefficientFromRatio(numerator, denominator, &error);
        if (!ratio || !ratio->fraction.IsProperFraction()) {
          std::cerr << "ratio " << FormatBalance(numerator) << "/" << FormatBalance(denominator)
                    << " broke the fraction bound\n";
          return EXIT_FAILURE;
        }
        std::vector<fee::PolynomialTerm> terms{fee::PolynomialTerm{1, *ratio}};
        if (!fee::FeePolynomial::Create(std::move(terms), &error)) {
          std::cerr << "derived coefficient rejected: " << error << "\n";
          return EXIT_FAILURE;
        }
      }
    }

    {
      // Never above the target, short by less than 1 + w_ref / 10^9 units.
      const std::pair<primitives::Weight, Balance> cases[] = {
          {1, 0},
          {1, 1},
          {7, 100},
          {125'000'000, 1'000'000'000},
          {125'000'000, 1'000'000'001},
          {999'999'937, 123'456'789'012'345ULL},
          {4'000'000'000ULL, 3},
          {1ULL << 50, (static_cast<Balance>(1) << 90) + 12345},
          {primitives::kMaxWeight, primitives::kMaxBalance},
      };
      for (const auto& [reference_weight, target] : cases) {
        std::string error;
        auto polynomial = fee::DeriveLinearPolynomial(reference_weight, target, &error);
        if (!polynomial) {
          std::cerr << "derivation failed: " << error << "\n";
          return EXIT_FAILURE;
        }
        const Balance fee_at_reference = polynomial->Calc(reference_weight);
        const Balance tolerance = 1 + reference_weight / 1'000'000'000ULL;
        if (fee_at_reference > target || target - fee_at_reference > tolerance) {
          std::cerr << "reference accuracy violated for w_ref=" << reference_weight
                    << " target=" << FormatBalance(target)
                    << " got=" << FormatBalance(fee_at_reference) << "\n";
          return EXIT_FAILURE;
        }
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "derivation_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (...) {
    std::cerr << "derivation_tests unknown exception\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
