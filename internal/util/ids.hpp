#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ledger::util {

/*
  Identifier helpers

  Event, trace and span ids are prefixed text ids ("evt_", "trc_", "spn_")
  built from RFC4122 v4 UUIDs. Generated span ids are deterministic so that
  every producer derives the same id for the same hop.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// "<prefix>_<uuid>"
std::string NewId(std::string_view prefix);

// 64-bit FNV-1a
uint64_t Fnv1a64(std::string_view data);

// zero padded lowercase hex, 16 digits
std::string HexU64(uint64_t value);

} // namespace ledger::util
