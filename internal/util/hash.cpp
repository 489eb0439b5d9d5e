#include "hash.hpp"

#include <iomanip>
#include <sstream>

namespace tracelens::util {

uint64_t Fnv1a64(std::string_view data, uint64_t seed) {
  constexpr uint64_t kPrime = 0x100000001b3ULL;

  uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kPrime;
  }
  return hash;
}

std::string ToHex(uint64_t value) {
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << value;
  return oss.str();
}

} // namespace tracelens::util
