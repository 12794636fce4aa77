#pragma once

#include <cstddef>
#include <cstdint>

#include "nearby/hal/interfaces.h"

namespace nearby {
namespace domain {

/**
 * Structural hash of the first `count` roster entries (clamped to roster size).
 * Covers membership and every tracked field; independent of entry order.
 * Never returns 0, so 0 can mean "no fingerprint yet".
 */
uint64_t roster_fingerprint(const Roster& roster, size_t count);

/** Hash of a single entry; exposed for tests. */
uint64_t friend_entry_hash(const FriendSnapshot& entry);

} // namespace domain
} // namespace nearby
