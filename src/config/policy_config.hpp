#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fee/fee_policy.hpp"
#include "fee/fee_polynomial.hpp"
#include "policy/fee_schedule.hpp"
#include "policy/policy_constants.hpp"
#include "primitives/balance.hpp"
#include "primitives/perbill.hpp"
#include "util/logging.hpp"

namespace weightfee::config {

inline constexpr std::uintmax_t kDefaultLogFileBytes = 10u * 1024u * 1024u;

// Diagnostic produced while options are collected, before the logger is
// configured from those same options.
struct ConfigNote {
  util::LogLevel level{util::LogLevel::kInfo};
  std::string message;
};

struct ConfigEntry {
  std::size_t line{0};
  std::string key;
  std::string value;
};

// Raw options collected from the config file, the environment and the
// command line. Unset optionals fall back to the selected preset.
struct PolicyOptions {
  std::string preset{"reference"};
  std::string name;
  std::optional<primitives::Balance> currency_scale;
  std::optional<primitives::Weight> reference_weight;
  std::optional<primitives::Balance> target_fee;
  std::optional<primitives::Balance> storage_item_price;
  std::optional<primitives::Balance> storage_byte_price;
  std::optional<std::uint64_t> slot_duration_ms;
  std::optional<std::uint32_t> epoch_length_blocks;
  std::optional<std::uint32_t> max_code_size_bytes;
  std::optional<primitives::Perbill> target_block_fullness;
  std::optional<primitives::Weight> max_block_weight;
  std::optional<policy::Probability> primary_probability;
  std::optional<fee::FeePolicyKind> fee_policy;
  std::vector<fee::PolynomialTerm> fee_terms;
  std::vector<fee::FeeStep> fee_steps;
  std::string log_level;
  std::string debug_log_path;
  std::vector<ConfigNote> notes;
};

// "degree:integer:fraction_parts[:negative]", e.g. "1:8:0" or "0:5:0:-".
fee::PolynomialTerm ParseFeeTerm(std::string_view text);
// "min_weight:fee".
fee::FeeStep ParseFeeStep(std::string_view text);
// "numerator/denominator".
policy::Probability ParseProbability(std::string_view text);

// Keys are case-insensitive and ignore '-' and '_'. Throws
// std::runtime_error on malformed values; unknown keys are recorded in
// |opts->notes| and skipped.
void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       PolicyOptions* opts);

// "key = value" lines with '#' comments. Throws std::runtime_error prefixed
// with "source:line:" for lines without a value.
std::vector<ConfigEntry> ReadConfigEntries(std::istream& in, std::string_view source);

// Applies every entry of the file. A missing file is not an error.
void LoadConfigFile(const std::filesystem::path& path, PolicyOptions* opts);

// WEIGHTFEE_PRESET, WEIGHTFEE_LOG_LEVEL.
void ApplyEnvironmentOverrides(PolicyOptions* opts);

// Logger settings for log_level and debug_log. Throws std::runtime_error on
// an unknown level; a debug log file rolls over at kDefaultLogFileBytes.
util::LogSettings LogSettingsFromOptions(const PolicyOptions& opts);

// Writes and clears the notes collected while loading options.
void ReportConfigNotes(PolicyOptions* opts);

bool ResolvePolicy(const PolicyOptions& opts, policy::PolicyConstants* constants,
                   policy::FeePolicyConfig* fee_config, std::string* error);

std::optional<policy::FeeSchedule> LoadFeeSchedule(const PolicyOptions& opts,
                                                   std::string* error);

}  // namespace weightfee::config
