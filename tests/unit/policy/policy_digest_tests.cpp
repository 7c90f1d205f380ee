#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "policy/fee_schedule.hpp"
#include "policy/policy_constants.hpp"
#include "policy/policy_digest.hpp"

using namespace weightfee;
using policy::FeePolicyConfig;
using policy::FeeSchedule;
using policy::PolicyConstants;

namespace {

FeeSchedule Build(const PolicyConstants& constants, const FeePolicyConfig& config) {
  std::string error;
  auto schedule = FeeSchedule::Create(constants, config, &error);
  if (!schedule) {
    throw std::runtime_error("schedule rejected: " + error);
  }
  return *schedule;
}

FeePolicyConfig Polynomial(primitives::Balance linear_integer) {
  FeePolicyConfig config;
  config.kind = fee::FeePolicyKind::kPolynomial;
  fee::PolynomialTerm term;
  term.degree = 1;
  term.coefficient.integer = linear_integer;
  config.terms.push_back(term);
  return config;
}

}  // namespace

int main() {
  try {
    const auto& reference = policy::ReferencePolicy(policy::Preset::kReference);
    const auto a = Build(reference, FeePolicyConfig{});
    const auto b = Build(reference, FeePolicyConfig{});
    if (policy::FeeScheduleDigest(a) != policy::FeeScheduleDigest(b) ||
        policy::SerializeFeeSchedule(a) != policy::SerializeFeeSchedule(b)) {
      std::cerr << "identical schedules produced different digests\n";
      return EXIT_FAILURE;
    }

    PolicyConstants renamed = reference;
    renamed.name = "staging";
    if (policy::FeeScheduleDigest(Build(renamed, FeePolicyConfig{})) !=
        policy::FeeScheduleDigest(a)) {
      std::cerr << "display name changed the digest\n";
      return EXIT_FAILURE;
    }

    PolicyConstants cheaper = reference;
    cheaper.storage_byte_price -= 1;
    if (policy::FeeScheduleDigest(Build(cheaper, FeePolicyConfig{})) ==
        policy::FeeScheduleDigest(a)) {
      std::cerr << "byte price did not affect the digest\n";
      return EXIT_FAILURE;
    }

    // An explicit polynomial equal to the derived one still differs by kind.
    const auto explicit_linear = Build(reference, Polynomial(8));
    if (policy::FeeScheduleDigest(explicit_linear) == policy::FeeScheduleDigest(a)) {
      std::cerr << "policy kind did not affect the digest\n";
      return EXIT_FAILURE;
    }
    if (policy::FeeScheduleDigest(Build(reference, Polynomial(9))) ==
        policy::FeeScheduleDigest(explicit_linear)) {
      std::cerr << "term coefficient did not affect the digest\n";
      return EXIT_FAILURE;
    }

    const std::string hex = policy::FeeScheduleDigestHex(a);
    if (hex.size() != 64 || hex.find_first_not_of("0123456789abcdef") != std::string::npos) {
      std::cerr << "digest hex is malformed: " << hex << "\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "policy_digest_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (...) {
    std::cerr << "policy_digest_tests unknown exception\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
