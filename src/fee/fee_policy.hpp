#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fee/fee_polynomial.hpp"
#include "primitives/balance.hpp"

namespace weightfee::fee {

enum class FeePolicyKind {
  kLinear,
  kPolynomial,
  kStep,
};

std::string_view FeePolicyKindName(FeePolicyKind kind);
std::optional<FeePolicyKind> FeePolicyKindFromString(std::string_view name);

// Weight-to-fee mapping consumed by the fee-charging pipeline. Evaluate() is
// const and stateless, so one instance may be shared by any number of threads.
class FeePolicy {
 public:
  virtual ~FeePolicy() = default;

  virtual primitives::Balance Evaluate(primitives::Weight weight) const = 0;
  virtual FeePolicyKind Kind() const = 0;
};

class PolynomialFeePolicy final : public FeePolicy {
 public:
  PolynomialFeePolicy(FeePolynomial polynomial, FeePolicyKind kind)
      : polynomial_(std::move(polynomial)), kind_(kind) {}

  primitives::Balance Evaluate(primitives::Weight weight) const override {
    return polynomial_.Calc(weight);
  }
  FeePolicyKind Kind() const override { return kind_; }

  const FeePolynomial& Polynomial() const { return polynomial_; }

 private:
  FeePolynomial polynomial_;
  FeePolicyKind kind_;
};

struct FeeStep {
  primitives::Weight min_weight{0};
  primitives::Balance fee{0};

  bool operator==(const FeeStep& other) const {
    return min_weight == other.min_weight && fee == other.fee;
  }
};

// Step function: the fee of the last entry whose min_weight <= weight, or
// zero below the first entry. Lookup is a binary search over at most
// kMaxFeeSteps entries.
class StepFeePolicy final : public FeePolicy {
 public:
  static constexpr std::size_t kMaxFeeSteps = 64;

  static std::unique_ptr<StepFeePolicy> Create(std::vector<FeeStep> steps, std::string* error);

  primitives::Balance Evaluate(primitives::Weight weight) const override;
  FeePolicyKind Kind() const override { return FeePolicyKind::kStep; }

  const std::vector<FeeStep>& Steps() const { return steps_; }

 private:
  explicit StepFeePolicy(std::vector<FeeStep> steps) : steps_(std::move(steps)) {}

  std::vector<FeeStep> steps_;
};

}  // namespace weightfee::fee
