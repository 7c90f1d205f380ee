#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "policy/fee_schedule.hpp"

namespace weightfee::policy {

// Canonical little-endian encoding of everything that affects a computed fee
// or deposit. The display name is not part of the encoding.
std::vector<std::uint8_t> SerializeFeeSchedule(const FeeSchedule& schedule);

// SHA3-256 over SerializeFeeSchedule(); two parties with equal digests
// compute bit-identical fees for every weight.
crypto::Sha3_256Hash FeeScheduleDigest(const FeeSchedule& schedule);
std::string FeeScheduleDigestHex(const FeeSchedule& schedule);

}  // namespace weightfee::policy
