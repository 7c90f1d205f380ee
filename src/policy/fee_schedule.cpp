#include "policy/fee_schedule.hpp"

#include <utility>

#include "fee/derivation.hpp"
#include "util/logging.hpp"

namespace weightfee::policy {

std::unique_ptr<fee::FeePolicy> BuildFeePolicy(const PolicyConstants& constants,
                                               FeePolicyConfig* config, std::string* error) {
  switch (config->kind) {
    case fee::FeePolicyKind::kLinear: {
      auto polynomial = fee::DeriveLinearPolynomial(constants.reference_weight,
                                                    constants.target_fee_at_reference, error);
      if (!polynomial) {
        return nullptr;
      }
      config->terms = polynomial->Terms();
      config->steps.clear();
      return std::make_unique<fee::PolynomialFeePolicy>(std::move(*polynomial),
                                                        fee::FeePolicyKind::kLinear);
    }
    case fee::FeePolicyKind::kPolynomial: {
      auto polynomial = fee::FeePolynomial::Create(config->terms, error);
      if (!polynomial) {
        return nullptr;
      }
      config->steps.clear();
      return std::make_unique<fee::PolynomialFeePolicy>(std::move(*polynomial),
                                                        fee::FeePolicyKind::kPolynomial);
    }
    case fee::FeePolicyKind::kStep: {
      config->terms.clear();
      return fee::StepFeePolicy::Create(config->steps, error);
    }
  }
  if (error) *error = "unknown fee policy kind";
  return nullptr;
}

FeeSchedule::FeeSchedule(PolicyConstants constants, FeePolicyConfig config,
                         std::shared_ptr<const fee::FeePolicy> policy)
    : constants_(std::move(constants)), config_(std::move(config)), policy_(std::move(policy)) {}

std::optional<FeeSchedule> FeeSchedule::Create(PolicyConstants constants, FeePolicyConfig config,
                                               std::string* error) {
  std::string reason;
  if (!ValidatePolicyConstants(constants, &reason)) {
    if (error) *error = "invalid policy constants: " + reason;
    return std::nullopt;
  }
  std::unique_ptr<fee::FeePolicy> policy = BuildFeePolicy(constants, &config, &reason);
  if (!policy) {
    if (error) *error = "invalid fee policy: " + reason;
    return std::nullopt;
  }
  util::LogDebug("policy", "schedule '" + constants.name + "' built with " +
                               std::string(fee::FeePolicyKindName(config.kind)) + " fee policy");
  return FeeSchedule(std::move(constants), std::move(config), std::move(policy));
}

}  // namespace weightfee::policy
