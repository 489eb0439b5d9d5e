#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tracelens::util {

/*
  Stable content hashing.

  FNV-1a 64-bit; identical on every platform and run, so it is safe to use
  for pattern ids and cache keys that must survive a restart.
*/

uint64_t Fnv1a64(std::string_view data, uint64_t seed = 0xcbf29ce484222325ULL);

// 16 lowercase hex characters.
std::string ToHex(uint64_t value);

} // namespace tracelens::util
