#include "policy/policy_json.hpp"

#include <string>

#include "policy/policy_digest.hpp"

namespace weightfee::policy {

nlohmann::json CoefficientToJson(const fee::RationalCoefficient& coefficient) {
  nlohmann::json out;
  out["integer"] = primitives::FormatBalance(coefficient.integer);
  out["fraction_parts"] = coefficient.fraction.Parts();
  out["fraction_denominator"] = primitives::kPerbillDenominator;
  out["negative"] = coefficient.negative;
  out["text"] = fee::DescribeCoefficient(coefficient);
  return out;
}

nlohmann::json ConstantsToJson(const PolicyConstants& c) {
  nlohmann::json out;
  out["name"] = c.name;
  out["currency_scale"] = primitives::FormatBalance(c.currency_scale);
  out["reference_weight"] = c.reference_weight;
  out["target_fee_at_reference"] = primitives::FormatBalance(c.target_fee_at_reference);
  out["storage_item_price"] = primitives::FormatBalance(c.storage_item_price);
  out["storage_byte_price"] = primitives::FormatBalance(c.storage_byte_price);
  out["slot_duration_ms"] = c.slot_duration_ms;
  out["epoch_length_blocks"] = c.epoch_length_blocks;
  out["max_code_size_bytes"] = c.max_code_size_bytes;
  out["target_block_fullness_parts"] = c.target_block_fullness.Parts();
  out["max_block_weight"] = c.max_block_weight;
  out["primary_probability"] = nlohmann::json::array(
      {c.primary_probability.numerator, c.primary_probability.denominator});
  return out;
}

nlohmann::json DescribeFeeSchedule(const FeeSchedule& schedule) {
  nlohmann::json out;
  out["constants"] = ConstantsToJson(schedule.Constants());

  const auto currency = schedule.CurrencyUnits();
  nlohmann::json currency_json;
  currency_json["units_per_major"] = primitives::FormatBalance(currency.units_per_major);
  currency_json["millicents"] = primitives::FormatBalance(currency.millicents);
  currency_json["cents"] = primitives::FormatBalance(currency.cents);
  currency_json["dollars"] = primitives::FormatBalance(currency.dollars);
  out["currency"] = currency_json;

  const auto time = schedule.Time();
  nlohmann::json time_json;
  time_json["minutes"] = time.minutes;
  time_json["hours"] = time.hours;
  time_json["days"] = time.days;
  out["time_blocks"] = time_json;

  const auto& config = schedule.Config();
  nlohmann::json policy_json;
  policy_json["kind"] = std::string(fee::FeePolicyKindName(config.kind));
  if (config.kind == fee::FeePolicyKind::kStep) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : config.steps) {
      nlohmann::json step_json;
      step_json["min_weight"] = step.min_weight;
      step_json["fee"] = primitives::FormatBalance(step.fee);
      steps.push_back(step_json);
    }
    policy_json["steps"] = steps;
  } else {
    nlohmann::json terms = nlohmann::json::array();
    for (const auto& term : config.terms) {
      nlohmann::json term_json;
      term_json["degree"] = term.degree;
      term_json["coefficient"] = CoefficientToJson(term.coefficient);
      terms.push_back(term_json);
    }
    policy_json["terms"] = terms;
  }
  const auto& constants = schedule.Constants();
  policy_json["fee_at_reference_weight"] =
      primitives::FormatBalance(schedule.ComputeFee(constants.reference_weight));
  if (constants.max_block_weight != 0) {
    policy_json["fee_at_max_block_weight"] =
        primitives::FormatBalance(schedule.ComputeFee(constants.max_block_weight));
  }
  out["fee_policy"] = policy_json;
  out["digest"] = FeeScheduleDigestHex(schedule);
  return out;
}

}  // namespace weightfee::policy
