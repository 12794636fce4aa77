#include "domain/roster_fingerprint.h"

#include <cstring>

namespace nearby {
namespace domain {

namespace {

constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

void fnv_bytes(uint64_t& h, const void* data, size_t len) {
  const uint8_t* p = static_cast<const uint8_t*>(data);
  for (size_t i = 0; i < len; ++i) {
    h ^= p[i];
    h *= kFnvPrime;
  }
}

void fnv_u64(uint64_t& h, uint64_t value) {
  uint8_t bytes[8];
  for (int i = 0; i < 8; ++i) {
    bytes[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
  }
  fnv_bytes(h, bytes, sizeof(bytes));
}

void fnv_double(uint64_t& h, double value) {
  // +0.0 and -0.0 compare equal and must hash equal.
  if (value == 0.0) {
    value = 0.0;
  }
  uint64_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  fnv_u64(h, bits);
}

// splitmix64 finalizer: spreads entry hashes before the commutative combine.
uint64_t mix64(uint64_t x) {
  x ^= x >> 30;
  x *= 0xbf58476d1ce4e5b9ULL;
  x ^= x >> 27;
  x *= 0x94d049bb133111ebULL;
  x ^= x >> 31;
  return x;
}

} // namespace

uint64_t friend_entry_hash(const FriendSnapshot& entry) {
  uint64_t h = kFnvOffset;
  fnv_u64(h, entry.id.size());
  fnv_bytes(h, entry.id.data(), entry.id.size());
  fnv_u64(h, entry.display_name.size());
  fnv_bytes(h, entry.display_name.data(), entry.display_name.size());
  const uint8_t flags = static_cast<uint8_t>((entry.has_coordinate ? 0x01 : 0x00) |
                                             (entry.is_online ? 0x02 : 0x00));
  fnv_bytes(h, &flags, 1);
  if (entry.has_coordinate) {
    fnv_double(h, entry.coordinate.latitude);
    fnv_double(h, entry.coordinate.longitude);
  }
  fnv_u64(h, static_cast<uint64_t>(entry.last_active_at_ms));
  return h;
}

uint64_t roster_fingerprint(const Roster& roster, size_t count) {
  const size_t n = count < roster.size() ? count : roster.size();
  uint64_t sum = 0;
  uint64_t xored = 0;
  for (size_t i = 0; i < n; ++i) {
    const uint64_t e = mix64(friend_entry_hash(roster[i]));
    sum += e;
    xored ^= mix64(e ^ 0x9e3779b97f4a7c15ULL);
  }
  uint64_t fp = mix64(sum ^ mix64(xored) ^ mix64(static_cast<uint64_t>(n) + 1));
  return fp == 0 ? 1 : fp;
}

} // namespace domain
} // namespace nearby
