#pragma once

#include "nlohmann/json.hpp"
#include "policy/fee_schedule.hpp"

namespace weightfee::policy {

// Balances exceed the 64-bit JSON number range, so they are emitted as
// decimal strings throughout.
nlohmann::json CoefficientToJson(const fee::RationalCoefficient& coefficient);
nlohmann::json ConstantsToJson(const PolicyConstants& constants);
nlohmann::json DescribeFeeSchedule(const FeeSchedule& schedule);

}  // namespace weightfee::policy
