#pragma once

#include <cstdint>
#include <vector>

#include "primitives/balance.hpp"

namespace weightfee::primitives::serialize {

// Little-endian fixed-width writers used for canonical policy encodings.
void WriteUint8(std::vector<std::uint8_t>* out, std::uint8_t value);
void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteBalance(std::vector<std::uint8_t>* out, Balance value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);

}  // namespace weightfee::primitives::serialize
