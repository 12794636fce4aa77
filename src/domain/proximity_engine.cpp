#include "domain/proximity_engine.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "domain/roster_fingerprint.h"
#include "utils/geo_utils.h"

namespace nearby {
namespace domain {

namespace {

size_t considered_size(const Roster& roster, const EngineConfig& config) {
  return roster.size() > config.max_tracked_friends ? config.max_tracked_friends : roster.size();
}

NearbyFriendResult make_result(const FriendSnapshot& entry, double distance, float score) {
  NearbyFriendResult out;
  out.id = entry.id;
  out.display_name = entry.display_name;
  out.coordinate = entry.coordinate;
  out.distance_m = distance;
  out.formatted_distance = format_distance(distance);
  out.is_online = entry.is_online;
  out.last_active_at_ms = entry.last_active_at_ms;
  out.rank_score = score;
  out.bucket = proximity_bucket(distance);
  return out;
}

} // namespace

const char* tick_path_str(TickPath path) {
  switch (path) {
    case TickPath::RECOMPUTED: return "recomputed";
    case TickPath::CACHE_REUSED: return "cache_reused";
    case TickPath::DEGRADED_CACHED: return "degraded_cached";
    case TickPath::DEGRADED_PASS_THROUGH: return "degraded_pass_through";
  }
  return "?";
}

RecomputeResult recompute(EngineState state,
                          const Roster& roster,
                          const UserLocationSample& sample,
                          uint64_t roster_fingerprint,
                          int64_t now_ms,
                          const EngineConfig& config) {
  RecomputeResult result{};
  RecomputeReport& report = result.report;
  report.input_count = roster.size();
  report.considered_count = considered_size(roster, config);
  report.capped = report.considered_count < report.input_count;

  const SmartRankingScorer scorer(config);
  const GeoFilter filter(config.geo_filter_radius_m);

  NearbyFriendList ranked;
  ranked.reserve(report.considered_count);
  for (size_t i = 0; i < report.considered_count; ++i) {
    const FriendSnapshot& entry = roster[i];
    if (!entry.has_coordinate) {
      report.no_coordinate_count++;
      continue;
    }
    if (!is_valid_coordinate(entry.coordinate)) {
      report.malformed_count++;
      continue;
    }
    const double distance = distance_m(sample.coordinate, entry.coordinate);
    if (std::isnan(distance)) {
      report.malformed_count++;
      continue;
    }
    ranked.push_back(make_result(
        entry, distance,
        scorer.score(distance, entry.last_active_at_ms, entry.is_online, now_ms)));
  }

  report.filtered_out_count = filter.filter_in_place(&ranked);
  std::sort(ranked.begin(), ranked.end(), rank_less);
  for (const NearbyFriendResult& r : ranked) {
    report.bucket_counts[static_cast<size_t>(r.bucket)]++;
  }

  state.has_user_sample = true;
  state.last_user_sample = sample;
  state.last_recalculation_at_ms = now_ms;
  state.last_roster_fingerprint = roster_fingerprint;
  state.cached_results = std::move(ranked);
  result.state = std::move(state);
  return result;
}

NearbyFriendList pass_through(const Roster& roster,
                              int64_t now_ms,
                              const EngineConfig& config,
                              RecomputeReport* report) {
  RecomputeReport local{};
  RecomputeReport& r = report ? *report : local;
  r = RecomputeReport{};
  r.input_count = roster.size();
  r.considered_count = considered_size(roster, config);
  r.capped = r.considered_count < r.input_count;

  const SmartRankingScorer scorer(config);
  NearbyFriendList out;
  out.reserve(r.considered_count);
  for (size_t i = 0; i < r.considered_count; ++i) {
    const FriendSnapshot& entry = roster[i];
    if (!entry.has_coordinate) {
      r.no_coordinate_count++;
      continue;
    }
    if (!is_valid_coordinate(entry.coordinate)) {
      r.malformed_count++;
      continue;
    }
    out.push_back(make_result(
        entry, kUnknownDistanceM,
        scorer.score(kUnknownDistanceM, entry.last_active_at_ms, entry.is_online, now_ms)));
    r.bucket_counts[static_cast<size_t>(ProximityBucket::UNKNOWN)]++;
  }
  return out;
}

ProximityEngine::ProximityEngine() : ProximityEngine(EngineConfig{}) {}

ProximityEngine::ProximityEngine(const EngineConfig& config)
    : config_(config),
      policy_(config),
      change_detector_(config),
      cache_(config.max_tracked_friends) {}

TickOutcome ProximityEngine::on_tick(const Roster& roster,
                                     const UserLocationSample* sample,
                                     int64_t now_ms) {
  TickOutcome outcome{};

  if (!sample) {
    if (cache_.has_results()) {
      outcome.path = TickPath::DEGRADED_CACHED;
      outcome.results = &cache_.results();
    } else {
      outcome.path = TickPath::DEGRADED_PASS_THROUGH;
      pass_through_ = pass_through(roster, now_ms, config_, &outcome.report);
      outcome.results = &pass_through_;
    }
    outcome.emit = change_detector_.offer(*outcome.results);
    return outcome;
  }

  const uint64_t fingerprint = roster_fingerprint(roster, config_.max_tracked_friends);
  outcome.decision = policy_.evaluate(cache_.state(), *sample, fingerprint, now_ms);

  if (outcome.decision.recompute()) {
    RecomputeResult next = recompute(cache_.take(), roster, *sample, fingerprint, now_ms, config_);
    cache_.replace(std::move(next.state));
    outcome.report = next.report;
    outcome.path = TickPath::RECOMPUTED;
    recompute_count_++;
    // The pass-through buffer is only meaningful until a ranked result exists.
    if (!pass_through_.empty()) {
      NearbyFriendList().swap(pass_through_);
    }
  } else {
    outcome.path = TickPath::CACHE_REUSED;
  }

  outcome.results = &cache_.results();
  outcome.emit = change_detector_.offer(*outcome.results);
  return outcome;
}

void ProximityEngine::reset() {
  cache_.clear();
  change_detector_.reset();
  NearbyFriendList().swap(pass_through_);
  recompute_count_ = 0;
}

} // namespace domain
} // namespace nearby
