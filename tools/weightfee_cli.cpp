#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config/policy_config.hpp"
#include "fee/derivation.hpp"
#include "nlohmann/json.hpp"
#include "policy/fee_schedule.hpp"
#include "policy/policy_digest.hpp"
#include "policy/policy_json.hpp"
#include "primitives/balance.hpp"
#include "util/logging.hpp"

namespace {

using weightfee::primitives::FormatBalance;

struct CliOptions {
  std::string config_path;
  bool disable_config_file{false};
  std::optional<std::string> preset;
  std::optional<std::string> log_level;
  std::optional<std::string> debug_log_path;
  bool raw{false};
  std::vector<std::string> args;
};

void PrintUsage() {
  std::cout << "Usage: weightfee-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  calc <weight> [weight...]       Fee charged for each weight\n"
            << "  derive <reference_weight> <target_fee>\n"
            << "                                  Linear coefficient calibrated to the target\n"
            << "  deposit <items> <bytes>         Storage deposit\n"
            << "  units                           Currency and time units\n"
            << "  describe                        Full policy as JSON\n"
            << "  digest                          SHA3-256 fingerprint of the policy\n"
            << "Options:\n"
            << "  --conf <path>         Config file (default weightfee.conf)\n"
            << "  --no-conf             Disable config file loading\n"
            << "  --preset <name>       reference or dev (default reference)\n"
            << "  --log-level <level>   debug, info, warn, error (default warn)\n"
            << "  --debug-log <path>    Write log lines to a file instead of stderr\n"
            << "  --raw                 Print raw JSON\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  std::vector<std::string> tokens;
  tokens.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      tokens.push_back(token.substr(0, eq_pos));
      tokens.push_back(token.substr(eq_pos + 1));
    } else {
      tokens.push_back(std::move(token));
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= tokens.size()) {
      throw std::runtime_error("missing value for " + tokens[idx]);
    }
    return tokens[++idx];
  };
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const std::string& arg = tokens[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    } else if (arg == "--preset") {
      opts.preset = ensure_value(i);
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
    } else if (arg == "--debug-log") {
      opts.debug_log_path = ensure_value(i);
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg.rfind("--", 0) == 0) {
      throw std::runtime_error("unknown option " + arg);
    } else {
      opts.args.push_back(arg);
    }
  }
  if (opts.args.empty()) {
    throw std::runtime_error("no command given (see --help)");
  }
  return opts;
}

// Config file, then environment, then command line.
weightfee::config::PolicyOptions BuildPolicyOptions(const CliOptions& opts) {
  weightfee::config::PolicyOptions policy_opts;
  if (!opts.disable_config_file) {
    const std::filesystem::path path = opts.config_path.empty()
                                           ? std::filesystem::path("weightfee.conf")
                                           : std::filesystem::path(opts.config_path);
    if (!opts.config_path.empty() && !std::filesystem::exists(path)) {
      throw std::runtime_error("config file not found: " + path.string());
    }
    weightfee::config::LoadConfigFile(path, &policy_opts);
  }
  weightfee::config::ApplyEnvironmentOverrides(&policy_opts);
  if (opts.preset) policy_opts.preset = *opts.preset;
  if (opts.log_level) policy_opts.log_level = *opts.log_level;
  if (opts.debug_log_path) policy_opts.debug_log_path = *opts.debug_log_path;
  return policy_opts;
}

// Runs after every option source is applied, so log_level and debug_log from
// the config file also cover the notes recorded while reading it.
void ConfigureLogging(weightfee::config::PolicyOptions* policy_opts) {
  weightfee::util::GetLogger().Apply(weightfee::config::LogSettingsFromOptions(*policy_opts));
  weightfee::config::ReportConfigNotes(policy_opts);
}

weightfee::primitives::Weight RequireWeightArg(const std::string& text) {
  auto value = weightfee::primitives::ParseWeight(text);
  if (!value) {
    throw std::runtime_error("invalid weight: '" + text + "'");
  }
  return *value;
}

weightfee::primitives::Balance RequireBalanceArg(const std::string& text) {
  auto value = weightfee::primitives::ParseBalance(text);
  if (!value) {
    throw std::runtime_error("invalid balance: '" + text + "'");
  }
  return *value;
}

void RequireArgCount(const CliOptions& opts, std::size_t count, std::string_view usage) {
  if (opts.args.size() != count + 1) {
    throw std::runtime_error("usage: weightfee-cli " + std::string(usage));
  }
}

nlohmann::json HandleCalc(const CliOptions& opts, const weightfee::policy::FeeSchedule& schedule) {
  if (opts.args.size() < 2) {
    throw std::runtime_error("usage: weightfee-cli calc <weight> [weight...]");
  }
  nlohmann::json results = nlohmann::json::array();
  for (std::size_t i = 1; i < opts.args.size(); ++i) {
    const auto weight = RequireWeightArg(opts.args[i]);
    nlohmann::json entry;
    entry["weight"] = weight;
    entry["fee"] = FormatBalance(schedule.ComputeFee(weight));
    results.push_back(entry);
  }
  return results;
}

nlohmann::json HandleDerive(const CliOptions& opts) {
  RequireArgCount(opts, 2, "derive <reference_weight> <target_fee>");
  const auto reference_weight = RequireWeightArg(opts.args[1]);
  const auto target_fee = RequireBalanceArg(opts.args[2]);
  std::string error;
  auto polynomial =
      weightfee::fee::DeriveLinearPolynomial(reference_weight, target_fee, &error);
  if (!polynomial) {
    throw std::runtime_error(error);
  }
  nlohmann::json result;
  result["degree"] = polynomial->Terms().front().degree;
  result["coefficient"] =
      weightfee::policy::CoefficientToJson(polynomial->Terms().front().coefficient);
  result["fee_at_reference"] = FormatBalance(polynomial->Calc(reference_weight));
  return result;
}

nlohmann::json HandleDeposit(const CliOptions& opts,
                             const weightfee::policy::FeeSchedule& schedule) {
  RequireArgCount(opts, 2, "deposit <items> <bytes>");
  const auto items = RequireWeightArg(opts.args[1]);
  const auto bytes = RequireWeightArg(opts.args[2]);
  nlohmann::json result;
  result["items"] = items;
  result["bytes"] = bytes;
  result["deposit"] = FormatBalance(schedule.ComputeDeposit(items, bytes));
  return result;
}

nlohmann::json HandleUnits(const weightfee::policy::FeeSchedule& schedule) {
  const auto description = weightfee::policy::DescribeFeeSchedule(schedule);
  nlohmann::json result;
  result["currency"] = description.at("currency");
  result["time_blocks"] = description.at("time_blocks");
  result["epoch_length_blocks"] = schedule.Constants().epoch_length_blocks;
  result["max_code_size_bytes"] = schedule.Constants().max_code_size_bytes;
  return result;
}

void PrintResult(const CliOptions& opts, const nlohmann::json& result) {
  const std::string& command = opts.args.front();
  if (opts.raw) {
    std::cout << result.dump(2) << "\n";
    return;
  }
  if (command == "calc") {
    for (const auto& entry : result) {
      std::cout << "weight=" << entry.at("weight").get<std::uint64_t>()
                << " fee=" << entry.at("fee").get<std::string>() << "\n";
    }
  } else if (command == "deposit") {
    std::cout << result.at("deposit").get<std::string>() << "\n";
  } else if (command == "digest") {
    std::cout << result.get<std::string>() << "\n";
  } else {
    std::cout << result.dump(2) << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    auto policy_opts = BuildPolicyOptions(opts);
    ConfigureLogging(&policy_opts);

    const std::string& command = opts.args.front();
    if (command == "derive") {
      PrintResult(opts, HandleDerive(opts));
      return EXIT_SUCCESS;
    }

    std::string error;
    auto schedule = weightfee::config::LoadFeeSchedule(policy_opts, &error);
    if (!schedule) {
      throw std::runtime_error(error);
    }
    weightfee::util::LogInfo("cli", "policy '" + schedule->Constants().name + "' digest " +
                                        weightfee::policy::FeeScheduleDigestHex(*schedule));

    nlohmann::json result;
    if (command == "calc") {
      result = HandleCalc(opts, *schedule);
    } else if (command == "deposit") {
      result = HandleDeposit(opts, *schedule);
    } else if (command == "units") {
      result = HandleUnits(*schedule);
    } else if (command == "describe") {
      result = weightfee::policy::DescribeFeeSchedule(*schedule);
    } else if (command == "digest") {
      result = weightfee::policy::FeeScheduleDigestHex(*schedule);
    } else {
      throw std::runtime_error("unknown command '" + command + "' (see --help)");
    }
    PrintResult(opts, result);
  } catch (const std::exception& ex) {
    if (weightfee::util::GetLogger().WritesToFile()) {
      weightfee::util::LogError("cli", ex.what());
    }
    std::cerr << "weightfee-cli: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
