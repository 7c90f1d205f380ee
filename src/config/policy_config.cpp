#include "config/policy_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <utility>

#include "util/logging.hpp"

namespace weightfee::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::vector<std::string> SplitFields(std::string_view text, char separator) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      fields.push_back(Trim(std::string(text.substr(start))));
      break;
    }
    fields.push_back(Trim(std::string(text.substr(start, pos - start))));
    start = pos + 1;
  }
  return fields;
}

primitives::Balance RequireBalance(std::string_view what, std::string_view text) {
  auto value = primitives::ParseBalance(text);
  if (!value) {
    throw std::runtime_error("invalid " + std::string(what) + ": '" + std::string(text) + "'");
  }
  return *value;
}

std::uint64_t RequireUint(std::string_view what, std::string_view text, std::uint64_t max) {
  auto value = primitives::ParseWeight(text);
  if (!value || *value > max) {
    throw std::runtime_error("invalid " + std::string(what) + ": '" + std::string(text) +
                             "' (expected 0-" + std::to_string(max) + ")");
  }
  return *value;
}

std::uint32_t RequireUint32(std::string_view what, std::string_view text) {
  return static_cast<std::uint32_t>(RequireUint(what, text, 0xFFFFFFFFu));
}

bool ParseSign(const std::string& value) {
  std::string lower;
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "-" || lower == "neg" || lower == "negative" || lower == "1") {
    return true;
  }
  if (lower == "+" || lower == "pos" || lower == "positive" || lower == "0") {
    return false;
  }
  throw std::runtime_error("invalid term sign: '" + value + "'");
}

}  // namespace

fee::PolynomialTerm ParseFeeTerm(std::string_view text) {
  const auto fields = SplitFields(text, ':');
  if (fields.size() != 3 && fields.size() != 4) {
    throw std::runtime_error("invalid fee_term '" + std::string(text) +
                             "' (expected degree:integer:fraction_parts[:sign])");
  }
  fee::PolynomialTerm term;
  term.degree = static_cast<std::uint8_t>(RequireUint("term degree", fields[0], 0xFF));
  term.coefficient.integer = RequireBalance("term integer", fields[1]);
  term.coefficient.fraction = primitives::Perbill(RequireUint32("term fraction", fields[2]));
  term.coefficient.negative = fields.size() == 4 && ParseSign(fields[3]);
  return term;
}

fee::FeeStep ParseFeeStep(std::string_view text) {
  const auto fields = SplitFields(text, ':');
  if (fields.size() != 2) {
    throw std::runtime_error("invalid fee_step '" + std::string(text) +
                             "' (expected min_weight:fee)");
  }
  fee::FeeStep step;
  step.min_weight = RequireUint("step min_weight", fields[0], primitives::kMaxWeight);
  step.fee = RequireBalance("step fee", fields[1]);
  return step;
}

policy::Probability ParseProbability(std::string_view text) {
  const auto fields = SplitFields(text, '/');
  if (fields.size() != 2) {
    throw std::runtime_error("invalid probability '" + std::string(text) +
                             "' (expected numerator/denominator)");
  }
  policy::Probability p;
  p.numerator = RequireUint("probability numerator", fields[0], primitives::kMaxWeight);
  p.denominator = RequireUint("probability denominator", fields[1], primitives::kMaxWeight);
  return p;
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       PolicyOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "preset") {
    opts->preset = value;
  } else if (key == "name") {
    opts->name = value;
  } else if (key == "currencyscale") {
    opts->currency_scale = RequireBalance(raw_key, value);
  } else if (key == "referenceweight" || key == "baseweight") {
    opts->reference_weight = RequireUint(raw_key, value, primitives::kMaxWeight);
  } else if (key == "targetfee" || key == "targetfeeatreference") {
    opts->target_fee = RequireBalance(raw_key, value);
  } else if (key == "storageitemprice") {
    opts->storage_item_price = RequireBalance(raw_key, value);
  } else if (key == "storagebyteprice") {
    opts->storage_byte_price = RequireBalance(raw_key, value);
  } else if (key == "slotdurationms") {
    opts->slot_duration_ms = RequireUint(raw_key, value, primitives::kMaxWeight);
  } else if (key == "epochlengthblocks") {
    opts->epoch_length_blocks = RequireUint32(raw_key, value);
  } else if (key == "maxcodesizebytes" || key == "maxcodesize") {
    opts->max_code_size_bytes = RequireUint32(raw_key, value);
  } else if (key == "targetblockfullnesspercent") {
    opts->target_block_fullness = primitives::Perbill::FromPercent(
        static_cast<std::uint32_t>(RequireUint(raw_key, value, 100)));
  } else if (key == "targetblockfullnessparts") {
    opts->target_block_fullness =
        primitives::Perbill(static_cast<std::uint32_t>(
            RequireUint(raw_key, value, primitives::kPerbillDenominator)));
  } else if (key == "maxblockweight") {
    opts->max_block_weight = RequireUint(raw_key, value, primitives::kMaxWeight);
  } else if (key == "primaryprobability") {
    opts->primary_probability = ParseProbability(value);
  } else if (key == "feepolicy") {
    auto kind = fee::FeePolicyKindFromString(value);
    if (!kind) {
      throw std::runtime_error("unknown fee_policy '" + value +
                               "' (expected linear, polynomial or step)");
    }
    opts->fee_policy = *kind;
  } else if (key == "feeterm") {
    opts->fee_terms.push_back(ParseFeeTerm(value));
  } else if (key == "feestep") {
    opts->fee_steps.push_back(ParseFeeStep(value));
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else {
    opts->notes.push_back({util::LogLevel::kWarn, "unknown config key '" + raw_key + "' ignored"});
  }
}

std::vector<ConfigEntry> ReadConfigEntries(std::istream& in, std::string_view source) {
  std::vector<ConfigEntry> entries;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    line = Trim(line.substr(0, line.find('#')));
    if (line.empty()) {
      continue;
    }
    // "key = value", "key=value" and "key value" are all accepted.
    const auto key_end = line.find_first_of("= \t");
    ConfigEntry entry;
    entry.line = line_number;
    entry.key = line.substr(0, key_end);
    if (key_end != std::string::npos) {
      std::string rest = Trim(line.substr(key_end));
      if (!rest.empty() && rest.front() == '=') {
        rest = Trim(rest.substr(1));
      }
      entry.value = std::move(rest);
    }
    if (entry.key.empty() || entry.value.empty()) {
      throw std::runtime_error(std::string(source) + ":" + std::to_string(line_number) +
                               ": expected 'key = value', got '" + line + "'");
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void LoadConfigFile(const std::filesystem::path& path, PolicyOptions* opts) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot read config file " + path.string());
  }
  const auto entries = ReadConfigEntries(in, path.string());
  for (const auto& entry : entries) {
    try {
      ApplyConfigOption(entry.key, entry.value, opts);
    } catch (const std::runtime_error& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(entry.line) + ": " +
                               ex.what());
    }
  }
  opts->notes.push_back({util::LogLevel::kDebug, "applied " + std::to_string(entries.size()) +
                                                     " settings from " + path.string()});
}

void ApplyEnvironmentOverrides(PolicyOptions* opts) {
  if (auto value = GetEnvValue("WEIGHTFEE_PRESET")) {
    opts->preset = std::move(*value);
  }
  if (auto value = GetEnvValue("WEIGHTFEE_LOG_LEVEL")) {
    opts->log_level = std::move(*value);
  }
}

util::LogSettings LogSettingsFromOptions(const PolicyOptions& opts) {
  util::LogSettings settings;
  if (!opts.log_level.empty()) {
    auto level = util::LogLevelFromString(opts.log_level);
    if (!level) {
      throw std::runtime_error("unknown log_level '" + opts.log_level +
                               "' (expected debug, info, warn or error)");
    }
    settings.level = *level;
  }
  settings.file_path = opts.debug_log_path;
  if (!settings.file_path.empty()) {
    settings.max_file_bytes = kDefaultLogFileBytes;
  }
  return settings;
}

void ReportConfigNotes(PolicyOptions* opts) {
  for (const auto& note : opts->notes) {
    util::GetLogger().Write(note.level, "config", note.message);
  }
  opts->notes.clear();
}

bool ResolvePolicy(const PolicyOptions& opts, policy::PolicyConstants* constants,
                   policy::FeePolicyConfig* fee_config, std::string* error) {
  const auto preset = policy::PresetFromString(opts.preset);
  if (!preset) {
    if (error) *error = "unknown preset '" + opts.preset + "'";
    return false;
  }
  policy::PolicyConstants c = policy::ReferencePolicy(*preset);
  if (!opts.name.empty()) c.name = opts.name;
  if (opts.currency_scale) c.currency_scale = *opts.currency_scale;
  if (opts.reference_weight) c.reference_weight = *opts.reference_weight;
  if (opts.target_fee) c.target_fee_at_reference = *opts.target_fee;
  if (opts.storage_item_price) c.storage_item_price = *opts.storage_item_price;
  if (opts.storage_byte_price) c.storage_byte_price = *opts.storage_byte_price;
  if (opts.slot_duration_ms) c.slot_duration_ms = *opts.slot_duration_ms;
  if (opts.epoch_length_blocks) c.epoch_length_blocks = *opts.epoch_length_blocks;
  if (opts.max_code_size_bytes) c.max_code_size_bytes = *opts.max_code_size_bytes;
  if (opts.target_block_fullness) c.target_block_fullness = *opts.target_block_fullness;
  if (opts.max_block_weight) c.max_block_weight = *opts.max_block_weight;
  if (opts.primary_probability) c.primary_probability = *opts.primary_probability;

  policy::FeePolicyConfig f;
  if (opts.fee_policy) {
    f.kind = *opts.fee_policy;
  } else if (!opts.fee_terms.empty()) {
    f.kind = fee::FeePolicyKind::kPolynomial;
  } else if (!opts.fee_steps.empty()) {
    f.kind = fee::FeePolicyKind::kStep;
  }
  if (f.kind == fee::FeePolicyKind::kLinear &&
      (!opts.fee_terms.empty() || !opts.fee_steps.empty())) {
    util::LogWarn("config", "fee_term/fee_step entries are ignored by the linear fee policy");
  }
  f.terms = opts.fee_terms;
  f.steps = opts.fee_steps;

  *constants = std::move(c);
  *fee_config = std::move(f);
  return true;
}

std::optional<policy::FeeSchedule> LoadFeeSchedule(const PolicyOptions& opts,
                                                   std::string* error) {
  policy::PolicyConstants constants;
  policy::FeePolicyConfig fee_config;
  if (!ResolvePolicy(opts, &constants, &fee_config, error)) {
    return std::nullopt;
  }
  return policy::FeeSchedule::Create(std::move(constants), std::move(fee_config), error);
}

}  // namespace weightfee::config
