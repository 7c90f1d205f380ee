#include "crypto/hash.hpp"

#include <oqs/sha3.h>

namespace weightfee::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

}  // namespace weightfee::crypto
