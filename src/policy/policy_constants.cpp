#include "policy/policy_constants.hpp"

#include <utility>

namespace weightfee::policy {

namespace {

constexpr primitives::Balance kReferenceCurrencyScale = 1'000'000'000'000ULL;
constexpr primitives::Weight kReferenceBaseWeight = 125'000'000;
constexpr primitives::Weight kReferenceMaxBlockWeight = 2'000'000'000'000ULL;
constexpr std::uint32_t kReferenceMaxCodeSize = 10u * 1024u * 1024u;  // 10 MiB

PolicyConstants BuildPolicy(std::string name, std::uint64_t slot_duration_ms,
                            std::uint32_t epoch_minutes) {
  const Currency currency = CurrencyFromScale(kReferenceCurrencyScale);
  const TimeUnits time = TimeUnitsFromSlot(slot_duration_ms);

  PolicyConstants p{};
  p.name = std::move(name);
  p.currency_scale = kReferenceCurrencyScale;
  // The base weight of a transaction costs a tenth of a cent.
  p.reference_weight = kReferenceBaseWeight;
  p.target_fee_at_reference = currency.cents / 10;
  p.storage_item_price = 20 * currency.dollars;
  p.storage_byte_price = 100 * currency.millicents;
  p.slot_duration_ms = slot_duration_ms;
  p.epoch_length_blocks = epoch_minutes * time.minutes;
  p.max_code_size_bytes = kReferenceMaxCodeSize;
  p.target_block_fullness = primitives::Perbill::FromPercent(25);
  p.max_block_weight = kReferenceMaxBlockWeight;
  // 1 in 4 blocks (on average, not counting collisions) is a primary block.
  p.primary_probability = Probability{1, 4};
  return p;
}

}  // namespace

std::optional<Preset> PresetFromString(std::string_view name) {
  if (name == "reference" || name == "ref") return Preset::kReference;
  if (name == "dev" || name == "development") return Preset::kDev;
  return std::nullopt;
}

std::string_view PresetName(Preset preset) {
  switch (preset) {
    case Preset::kReference:
      return "reference";
    case Preset::kDev:
      return "dev";
  }
  return "reference";
}

Currency CurrencyFromScale(primitives::Balance currency_scale) {
  Currency c{};
  c.units_per_major = currency_scale;
  c.millicents = currency_scale / kMillicentsPerMajorUnit;
  c.cents = primitives::SaturatingMul(c.millicents, 1000);
  c.dollars = primitives::SaturatingMul(c.cents, 100);
  return c;
}

TimeUnits TimeUnitsFromSlot(std::uint64_t slot_duration_ms) {
  TimeUnits t{};
  if (slot_duration_ms == 0) {
    return t;
  }
  t.minutes = static_cast<std::uint32_t>(kMillisecsPerMinute / slot_duration_ms);
  t.hours = t.minutes * 60;
  t.days = t.hours * 24;
  return t;
}

bool ValidatePolicyConstants(const PolicyConstants& constants, std::string* error) {
  if (constants.currency_scale == 0) {
    if (error) *error = "currency_scale must be non-zero";
    return false;
  }
  if (constants.reference_weight == 0) {
    if (error) *error = "reference_weight must be non-zero";
    return false;
  }
  if (constants.slot_duration_ms == 0) {
    if (error) *error = "slot_duration_ms must be non-zero";
    return false;
  }
  if (constants.epoch_length_blocks == 0) {
    if (error) *error = "epoch_length_blocks must be non-zero";
    return false;
  }
  if (!constants.target_block_fullness.IsValid()) {
    if (error) *error = "target_block_fullness exceeds 100%";
    return false;
  }
  if (constants.primary_probability.denominator == 0 ||
      constants.primary_probability.numerator > constants.primary_probability.denominator) {
    if (error) *error = "primary_probability must be a fraction in [0, 1]";
    return false;
  }
  if (constants.max_block_weight != 0 &&
      constants.max_block_weight < constants.reference_weight) {
    if (error) *error = "max_block_weight is below reference_weight";
    return false;
  }
  return true;
}

primitives::Balance Deposit(const PolicyConstants& constants, std::uint64_t items,
                            std::uint64_t bytes) {
  const auto item_part = primitives::SaturatingMul(items, constants.storage_item_price);
  const auto byte_part = primitives::SaturatingMul(bytes, constants.storage_byte_price);
  return primitives::SaturatingAdd(item_part, byte_part);
}

const PolicyConstants& ReferencePolicy(Preset preset) {
  static const PolicyConstants reference = BuildPolicy("reference", 6000, 10);
  // One-second slots and one-minute epochs for local networks.
  static const PolicyConstants dev = BuildPolicy("dev", 1000, 1);
  switch (preset) {
    case Preset::kReference:
      return reference;
    case Preset::kDev:
      return dev;
  }
  return reference;
}

}  // namespace weightfee::policy
