#include "domain/result_cache.h"

#include <utility>

namespace nearby {
namespace domain {

ResultCache::ResultCache(size_t max_entries) : max_entries_(max_entries) {}

EngineState ResultCache::take() {
  EngineState out = std::move(state_);
  state_ = EngineState{};
  return out;
}

void ResultCache::replace(EngineState state) {
  state_ = std::move(state);
  if (state_.cached_results.size() > max_entries_) {
    state_.cached_results.resize(max_entries_);
  }
}

void ResultCache::clear() {
  state_ = EngineState{};
  // Release capacity as well; an unsubscribed engine holds no roster memory.
  NearbyFriendList().swap(state_.cached_results);
}

} // namespace domain
} // namespace nearby
