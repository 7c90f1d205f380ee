#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fee/fee_policy.hpp"
#include "fee/fee_polynomial.hpp"
#include "primitives/balance.hpp"

using namespace weightfee;
using fee::FeeStep;
using fee::StepFeePolicy;
using primitives::Balance;
using primitives::FormatBalance;

namespace {

bool ExpectStepRejected(std::vector<FeeStep> steps, const char* label) {
  std::string error;
  if (StepFeePolicy::Create(std::move(steps), &error) || error.empty()) {
    std::cerr << "step table accepted: " << label << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!ExpectStepRejected({}, "empty table") ||
        !ExpectStepRejected({{100, 1}, {50, 2}}, "decreasing min_weight") ||
        !ExpectStepRejected({{100, 1}, {100, 2}}, "repeated min_weight") ||
        !ExpectStepRejected(std::vector<FeeStep>(StepFeePolicy::kMaxFeeSteps + 1), "oversized")) {
      return EXIT_FAILURE;
    }

    std::string error;
    auto table = StepFeePolicy::Create({{100, 10}, {1000, 50}, {5000, 70}}, &error);
    if (!table) {
      std::cerr << "step table rejected: " << error << "\n";
      return EXIT_FAILURE;
    }
    const std::pair<primitives::Weight, Balance> expectations[] = {
        {0, 0},      {99, 0},     {100, 10},   {999, 10},
        {1000, 50},  {4999, 50},  {5000, 70},  {primitives::kMaxWeight, 70},
    };
    for (const auto& [weight, expected] : expectations) {
      const Balance actual = table->Evaluate(weight);
      if (actual != expected) {
        std::cerr << "step fee at weight " << weight << " was " << FormatBalance(actual)
                  << ", expected " << FormatBalance(expected) << "\n";
        return EXIT_FAILURE;
      }
    }
    if (table->Kind() != fee::FeePolicyKind::kStep || table->Steps().size() != 3) {
      std::cerr << "step policy accessors returned unexpected values\n";
      return EXIT_FAILURE;
    }

    // A table starting at zero charges its first fee for empty work.
    auto floor_table = StepFeePolicy::Create({{0, 3}}, &error);
    if (!floor_table || floor_table->Evaluate(0) != 3 ||
        floor_table->Evaluate(primitives::kMaxWeight) != 3) {
      std::cerr << "single-entry step table misbehaved\n";
      return EXIT_FAILURE;
    }

    for (auto kind : {fee::FeePolicyKind::kLinear, fee::FeePolicyKind::kPolynomial,
                      fee::FeePolicyKind::kStep}) {
      auto parsed = fee::FeePolicyKindFromString(fee::FeePolicyKindName(kind));
      if (!parsed || *parsed != kind) {
        std::cerr << "policy kind name did not parse back: " << fee::FeePolicyKindName(kind)
                  << "\n";
        return EXIT_FAILURE;
      }
    }
    if (fee::FeePolicyKindFromString("table") != fee::FeePolicyKind::kStep ||
        fee::FeePolicyKindFromString("poly") != fee::FeePolicyKind::kPolynomial ||
        fee::FeePolicyKindFromString("quadratic")) {
      std::cerr << "policy kind aliases are wrong\n";
      return EXIT_FAILURE;
    }

    // Callers only see the base interface.
    fee::PolynomialTerm term;
    term.degree = 1;
    term.coefficient.integer = 8;
    auto polynomial = fee::FeePolynomial::Create({term}, &error);
    if (!polynomial) {
      std::cerr << "polynomial rejected: " << error << "\n";
      return EXIT_FAILURE;
    }
    std::unique_ptr<fee::FeePolicy> policy =
        std::make_unique<fee::PolynomialFeePolicy>(*polynomial, fee::FeePolicyKind::kLinear);
    if (policy->Kind() != fee::FeePolicyKind::kLinear) {
      std::cerr << "polynomial policy reported the wrong kind\n";
      return EXIT_FAILURE;
    }
    const primitives::Weight samples[] = {0, 1, 125'000'000, primitives::kMaxWeight};
    for (primitives::Weight w : samples) {
      if (policy->Evaluate(w) != polynomial->Calc(w)) {
        std::cerr << "polynomial policy disagrees with Calc at weight " << w << "\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "fee_policy_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (...) {
    std::cerr << "fee_policy_tests unknown exception\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
