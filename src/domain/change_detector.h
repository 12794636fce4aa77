#pragma once

#include "domain/engine_config.h"
#include "domain/nearby_friend.h"

namespace nearby {
namespace domain {

/**
 * Suppresses emissions that only differ by jitter. A candidate is emitted when
 * nothing was emitted yet, the size changed, the id at any position changed,
 * a displayed field changed, or any distance moved by >= distance tolerance or
 * any score by >= score tolerance.
 */
class ChangeDetector {
 public:
  ChangeDetector();
  explicit ChangeDetector(const EngineConfig& config);

  bool should_emit(const NearbyFriendList& previous, const NearbyFriendList& candidate) const;

  /** Stateful form: compares against the last accepted emission and records it when emitted. */
  bool offer(const NearbyFriendList& candidate);
  bool has_emitted() const { return has_emitted_; }
  const NearbyFriendList& last_emitted() const { return last_emitted_; }
  void reset();

 private:
  bool entry_changed(const NearbyFriendResult& a, const NearbyFriendResult& b) const;

  double distance_tolerance_m_;
  float score_tolerance_;
  bool has_emitted_ = false;
  NearbyFriendList last_emitted_;
};

} // namespace domain
} // namespace nearby
