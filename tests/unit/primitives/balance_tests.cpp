#include <cstdlib>
#include <iostream>
#include <string>

#include "primitives/balance.hpp"

using namespace weightfee::primitives;

int main() {
  try {
    if (SaturatingAdd(kMaxBalance, 1) != kMaxBalance || SaturatingAdd(2, 3) != 5) {
      std::cerr << "SaturatingAdd did not clamp at the maximum balance\n";
      return EXIT_FAILURE;
    }
    if (SaturatingSub(1, 2) != 0 || SaturatingSub(5, 3) != 2) {
      std::cerr << "SaturatingSub did not floor at zero\n";
      return EXIT_FAILURE;
    }
    if (SaturatingMul(kMaxBalance, 2) != kMaxBalance || SaturatingMul(0, kMaxBalance) != 0 ||
        SaturatingMul(kMaxBalance, 1) != kMaxBalance) {
      std::cerr << "SaturatingMul mis-handled the boundary\n";
      return EXIT_FAILURE;
    }

    if (SaturatingPow(2, 3) != 8 || SaturatingPow(7, 0) != 1 || SaturatingPow(0, 0) != 1 ||
        SaturatingPow(0, 3) != 0) {
      std::cerr << "SaturatingPow returned a wrong small power\n";
      return EXIT_FAILURE;
    }
    // (2^64 - 1)^2 still fits in 128 bits, the cube does not.
    const Balance max_weight = kMaxWeight;
    const Balance squared = SaturatingPow(max_weight, 2);
    if (squared != max_weight * max_weight) {
      std::cerr << "SaturatingPow saturated a representable square\n";
      return EXIT_FAILURE;
    }
    if (SaturatingPow(max_weight, 3) != kMaxBalance) {
      std::cerr << "SaturatingPow did not saturate the cube of the max weight\n";
      return EXIT_FAILURE;
    }

    const std::string max_text = "340282366920938463463374607431768211455";
    if (FormatBalance(kMaxBalance) != max_text || FormatBalance(0) != "0" ||
        FormatBalance(1'000'000'000'000ULL) != "1000000000000") {
      std::cerr << "FormatBalance produced an unexpected rendering: "
                << FormatBalance(kMaxBalance) << "\n";
      return EXIT_FAILURE;
    }
    auto parsed = ParseBalance(max_text);
    if (!parsed || *parsed != kMaxBalance) {
      std::cerr << "ParseBalance failed on the maximum balance\n";
      return EXIT_FAILURE;
    }
    if (ParseBalance("340282366920938463463374607431768211456")) {
      std::cerr << "ParseBalance accepted a value above 2^128 - 1\n";
      return EXIT_FAILURE;
    }
    auto separated = ParseBalance("1_000'000");
    if (!separated || *separated != 1'000'000) {
      std::cerr << "ParseBalance rejected digit separators\n";
      return EXIT_FAILURE;
    }
    for (const char* bad : {"", "_1", "1__0", "1_", "12a", "-5", " 1"}) {
      if (ParseBalance(bad)) {
        std::cerr << "ParseBalance accepted malformed input '" << bad << "'\n";
        return EXIT_FAILURE;
      }
    }

    auto weight = ParseWeight("18446744073709551615");
    if (!weight || *weight != kMaxWeight) {
      std::cerr << "ParseWeight failed on the maximum weight\n";
      return EXIT_FAILURE;
    }
    if (ParseWeight("18446744073709551616")) {
      std::cerr << "ParseWeight accepted a value above 2^64 - 1\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "balance_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (...) {
    std::cerr << "balance_tests unknown exception\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
