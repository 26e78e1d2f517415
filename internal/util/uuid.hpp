#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace flowlock::util {

/*
  UUID helpers

  Lock tokens and correlation ids are RFC4122 version 4 UUIDs in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewCorrelationId();

// Per-thread engine for jitter; seeded once per thread.
std::mt19937_64& ThreadRng();

} // namespace flowlock::util
