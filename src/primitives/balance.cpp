#include "primitives/balance.hpp"

#include <algorithm>

namespace weightfee::primitives {

std::string FormatBalance(Balance value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  out.reserve(40);
  while (value != 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::optional<Balance> ParseBalance(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  Balance result = 0;
  bool have_digit = false;
  bool prev_separator = false;
  for (char c : text) {
    if (c == '_' || c == '\'') {
      if (!have_digit || prev_separator) {
        return std::nullopt;
      }
      prev_separator = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<Balance>(c - '0');
    if (result > (kMaxBalance - digit) / 10) {
      return std::nullopt;
    }
    result = result * 10 + digit;
    have_digit = true;
    prev_separator = false;
  }
  if (!have_digit || prev_separator) {
    return std::nullopt;
  }
  return result;
}

std::optional<Weight> ParseWeight(std::string_view text) {
  const auto value = ParseBalance(text);
  if (!value || *value > static_cast<Balance>(kMaxWeight)) {
    return std::nullopt;
  }
  return static_cast<Weight>(*value);
}

}  // namespace weightfee::primitives
