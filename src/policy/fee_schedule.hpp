#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fee/fee_policy.hpp"
#include "fee/fee_polynomial.hpp"
#include "policy/policy_constants.hpp"
#include "primitives/balance.hpp"

namespace weightfee::policy {

// Which FeePolicy to build. |terms| is used by kPolynomial, |steps| by kStep;
// kLinear derives its single term from the constants.
struct FeePolicyConfig {
  fee::FeePolicyKind kind{fee::FeePolicyKind::kLinear};
  std::vector<fee::PolynomialTerm> terms;
  std::vector<fee::FeeStep> steps;
};

// Immutable bundle of configuration plus the fee policy built from it.
// Constructed once at startup and shared by const reference.
class FeeSchedule {
 public:
  static std::optional<FeeSchedule> Create(PolicyConstants constants, FeePolicyConfig config,
                                           std::string* error);

  primitives::Balance ComputeFee(primitives::Weight weight) const {
    return policy_->Evaluate(weight);
  }
  primitives::Balance ComputeDeposit(std::uint64_t items, std::uint64_t bytes) const {
    return Deposit(constants_, items, bytes);
  }

  const PolicyConstants& Constants() const { return constants_; }
  const FeePolicyConfig& Config() const { return config_; }
  const fee::FeePolicy& Policy() const { return *policy_; }
  Currency CurrencyUnits() const { return CurrencyFromScale(constants_.currency_scale); }
  TimeUnits Time() const { return TimeUnitsFromSlot(constants_.slot_duration_ms); }

 private:
  FeeSchedule(PolicyConstants constants, FeePolicyConfig config,
              std::shared_ptr<const fee::FeePolicy> policy);

  PolicyConstants constants_;
  FeePolicyConfig config_;
  std::shared_ptr<const fee::FeePolicy> policy_;
};

// Builds the FeePolicy described by |config|. For kLinear the resolved term
// is written back into |config->terms| so that it can be described and
// fingerprinted like an explicit polynomial.
std::unique_ptr<fee::FeePolicy> BuildFeePolicy(const PolicyConstants& constants,
                                               FeePolicyConfig* config, std::string* error);

}  // namespace weightfee::policy
