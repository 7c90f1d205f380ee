#include "policy/policy_digest.hpp"

#include <array>
#include <span>

#include "primitives/serialize.hpp"
#include "util/hex.hpp"

namespace weightfee::policy {

namespace {

constexpr std::array<std::uint8_t, 12> kEncodingTag = {
    'W', 'F', '-', 'P', 'O', 'L', 'I', 'C', 'Y', '-', 'V', '1'};

void SerializeConstants(const PolicyConstants& c, std::vector<std::uint8_t>* out) {
  namespace ser = primitives::serialize;
  ser::WriteBalance(out, c.currency_scale);
  ser::WriteUint64(out, c.reference_weight);
  ser::WriteBalance(out, c.target_fee_at_reference);
  ser::WriteBalance(out, c.storage_item_price);
  ser::WriteBalance(out, c.storage_byte_price);
  ser::WriteUint64(out, c.slot_duration_ms);
  ser::WriteUint32(out, c.epoch_length_blocks);
  ser::WriteUint32(out, c.max_code_size_bytes);
  ser::WriteUint32(out, c.target_block_fullness.Parts());
  ser::WriteUint64(out, c.max_block_weight);
  ser::WriteUint64(out, c.primary_probability.numerator);
  ser::WriteUint64(out, c.primary_probability.denominator);
}

}  // namespace

std::vector<std::uint8_t> SerializeFeeSchedule(const FeeSchedule& schedule) {
  namespace ser = primitives::serialize;
  std::vector<std::uint8_t> out(kEncodingTag.begin(), kEncodingTag.end());
  SerializeConstants(schedule.Constants(), &out);

  const auto& config = schedule.Config();
  ser::WriteUint8(&out, static_cast<std::uint8_t>(config.kind));
  ser::WriteVarInt(&out, config.terms.size());
  for (const auto& term : config.terms) {
    ser::WriteUint8(&out, term.degree);
    ser::WriteBalance(&out, term.coefficient.integer);
    ser::WriteUint32(&out, term.coefficient.fraction.Parts());
    ser::WriteUint8(&out, term.coefficient.negative ? 1 : 0);
  }
  ser::WriteVarInt(&out, config.steps.size());
  for (const auto& step : config.steps) {
    ser::WriteUint64(&out, step.min_weight);
    ser::WriteBalance(&out, step.fee);
  }
  return out;
}

crypto::Sha3_256Hash FeeScheduleDigest(const FeeSchedule& schedule) {
  const auto encoded = SerializeFeeSchedule(schedule);
  return crypto::Sha3_256(std::span<const std::uint8_t>(encoded.data(), encoded.size()));
}

std::string FeeScheduleDigestHex(const FeeSchedule& schedule) {
  return util::HexEncode(FeeScheduleDigest(schedule));
}

}  // namespace weightfee::policy
