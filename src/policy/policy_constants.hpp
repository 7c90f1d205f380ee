#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "primitives/balance.hpp"
#include "primitives/perbill.hpp"

namespace weightfee::policy {

enum class Preset {
  kReference,
  kDev,
};

std::optional<Preset> PresetFromString(std::string_view name);
std::string_view PresetName(Preset preset);

inline constexpr std::uint64_t kMillisecsPerMinute = 60'000;
// Display denominations below one major unit: 1 major = 100'000 millicents.
inline constexpr std::uint64_t kMillicentsPerMajorUnit = 100'000;

struct Currency {
  primitives::Balance units_per_major{0};
  primitives::Balance millicents{0};
  primitives::Balance cents{0};
  primitives::Balance dollars{0};
};

Currency CurrencyFromScale(primitives::Balance currency_scale);

// Time units measured in blocks.
struct TimeUnits {
  std::uint32_t minutes{0};
  std::uint32_t hours{0};
  std::uint32_t days{0};
};

TimeUnits TimeUnitsFromSlot(std::uint64_t slot_duration_ms);

struct Probability {
  std::uint64_t numerator{0};
  std::uint64_t denominator{1};
};

// Deployment-wide configuration. Fixed when the policy is loaded and never
// mutated afterwards.
struct PolicyConstants {
  std::string name;
  primitives::Balance currency_scale{0};
  // Smallest chargeable unit of work, used to calibrate the linear fee.
  primitives::Weight reference_weight{0};
  primitives::Balance target_fee_at_reference{0};
  primitives::Balance storage_item_price{0};
  primitives::Balance storage_byte_price{0};
  std::uint64_t slot_duration_ms{0};
  std::uint32_t epoch_length_blocks{0};
  std::uint32_t max_code_size_bytes{0};
  primitives::Perbill target_block_fullness{};
  primitives::Weight max_block_weight{0};
  // Share of slots expected to be primary slots.
  Probability primary_probability{};
};

bool ValidatePolicyConstants(const PolicyConstants& constants, std::string* error);

// items * storage_item_price + bytes * storage_byte_price, saturating.
primitives::Balance Deposit(const PolicyConstants& constants, std::uint64_t items,
                            std::uint64_t bytes);

inline bool CodeSizeAllowed(const PolicyConstants& constants, std::uint64_t code_size) {
  return code_size <= constants.max_code_size_bytes;
}

const PolicyConstants& ReferencePolicy(Preset preset);

}  // namespace weightfee::policy
