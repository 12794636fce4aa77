#include "domain/change_detector.h"

#include <cmath>

namespace nearby {
namespace domain {

namespace {

bool distances_close(double a, double b, double tolerance_m) {
  // Two undefined (pass-through) distances are the same distance.
  if (std::isinf(a) || std::isinf(b)) {
    return a == b;
  }
  return std::fabs(a - b) < tolerance_m;
}

} // namespace

ChangeDetector::ChangeDetector() : ChangeDetector(EngineConfig{}) {}

ChangeDetector::ChangeDetector(const EngineConfig& config)
    : distance_tolerance_m_(config.distance_tolerance_m),
      score_tolerance_(config.score_tolerance) {}

bool ChangeDetector::entry_changed(const NearbyFriendResult& a, const NearbyFriendResult& b) const {
  if (a.id != b.id || a.display_name != b.display_name || a.is_online != b.is_online) {
    return true;
  }
  if (!distances_close(a.distance_m, b.distance_m, distance_tolerance_m_)) {
    return true;
  }
  return !(std::fabs(a.rank_score - b.rank_score) < score_tolerance_);
}

bool ChangeDetector::should_emit(const NearbyFriendList& previous,
                                 const NearbyFriendList& candidate) const {
  if (previous.size() != candidate.size()) {
    return true;
  }
  for (size_t i = 0; i < candidate.size(); ++i) {
    if (entry_changed(previous[i], candidate[i])) {
      return true;
    }
  }
  return false;
}

bool ChangeDetector::offer(const NearbyFriendList& candidate) {
  if (has_emitted_ && !should_emit(last_emitted_, candidate)) {
    return false;
  }
  last_emitted_ = candidate;
  has_emitted_ = true;
  return true;
}

void ChangeDetector::reset() {
  has_emitted_ = false;
  NearbyFriendList().swap(last_emitted_);
}

} // namespace domain
} // namespace nearby
