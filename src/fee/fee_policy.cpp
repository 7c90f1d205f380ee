#include "fee/fee_policy.hpp"

#include <algorithm>
#include <iterator>

namespace weightfee::fee {

std::string_view FeePolicyKindName(FeePolicyKind kind) {
  switch (kind) {
    case FeePolicyKind::kLinear:
      return "linear";
    case FeePolicyKind::kPolynomial:
      return "polynomial";
    case FeePolicyKind::kStep:
      return "step";
  }
  return "linear";
}

std::optional<FeePolicyKind> FeePolicyKindFromString(std::string_view name) {
  if (name == "linear") return FeePolicyKind::kLinear;
  if (name == "polynomial" || name == "poly") return FeePolicyKind::kPolynomial;
  if (name == "step" || name == "table") return FeePolicyKind::kStep;
  return std::nullopt;
}

std::unique_ptr<StepFeePolicy> StepFeePolicy::Create(std::vector<FeeStep> steps,
                                                     std::string* error) {
  if (steps.empty()) {
    if (error) *error = "step fee table has no entries";
    return nullptr;
  }
  if (steps.size() > kMaxFeeSteps) {
    if (error) {
      *error = "step fee table has " + std::to_string(steps.size()) + " entries (max " +
               std::to_string(kMaxFeeSteps) + ")";
    }
    return nullptr;
  }
  for (std::size_t i = 1; i < steps.size(); ++i) {
    if (steps[i].min_weight <= steps[i - 1].min_weight) {
      if (error) {
        *error = "step fee table entry " + std::to_string(i) +
                 " does not increase min_weight";
      }
      return nullptr;
    }
  }
  return std::unique_ptr<StepFeePolicy>(new StepFeePolicy(std::move(steps)));
}

primitives::Balance StepFeePolicy::Evaluate(primitives::Weight weight) const {
  // First entry strictly above |weight|; the one before it applies.
  auto it = std::upper_bound(steps_.begin(), steps_.end(), weight,
                             [](primitives::Weight w, const FeeStep& step) {
                               return w < step.min_weight;
                             });
  if (it == steps_.begin()) {
    return 0;
  }
  return std::prev(it)->fee;
}

}  // namespace weightfee::fee
