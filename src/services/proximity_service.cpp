#include "services/proximity_service.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "domain/proximity_engine.h"
#include "utils/geo_utils.h"

namespace nearby {

namespace {

constexpr const char* kLogTag = "nearby";
constexpr size_t kLogLineMax = 160;
constexpr size_t kTopFriendsLogged = 5;

uint32_t clamp_u32(size_t value) {
  return value > 0xFFFFFFFFu ? 0xFFFFFFFFu : static_cast<uint32_t>(value);
}

} // namespace

float throttle_ratio(const EngineStats& stats) {
  const uint32_t evaluated = stats.recompute_count + stats.skip_count;
  if (evaluated == 0) {
    return 0.0f;
  }
  return static_cast<float>(stats.skip_count) / static_cast<float>(evaluated);
}

class ProximityService::Session : public ILocationObserver,
                                  public IRosterObserver,
                                  public std::enable_shared_from_this<Session> {
 public:
  Session(boost::asio::io_context& io,
          const domain::EngineConfig& config,
          const platform::IClock& clock,
          platform::ILogger* text_logger,
          domain::Logger* event_logger,
          INearbyFriendsSink& sink)
      : strand_(boost::asio::make_strand(io)),
        workers_(config.worker_threads),
        config_(config),
        clock_(clock),
        text_logger_(text_logger),
        event_logger_(event_logger),
        sink_(sink),
        engine_(config) {}

  void on_location(const UserLocationSample& sample) override {
    if (stopped_) {
      return;
    }
    if (!is_valid_coordinate(sample.coordinate)) {
      on_location_error("invalid coordinate");
      return;
    }
    std::lock_guard<std::mutex> lock(mailbox_mutex_);
    pending_location_ = sample;
    has_pending_location_ = true;
    schedule_drain_locked();
  }

  void on_location_error(const char* reason) override {
    post_source_error(SourceKind::LOCATION, reason);
  }

  void on_roster(const Roster& roster) override {
    if (stopped_) {
      return;
    }
    std::lock_guard<std::mutex> lock(mailbox_mutex_);
    pending_roster_ = roster;
    has_pending_roster_ = true;
    schedule_drain_locked();
  }

  void on_roster_error(const char* reason) override {
    post_source_error(SourceKind::ROSTER, reason);
  }

  /** Stop processing, wait for the worker, release everything the engine holds. */
  void shutdown() {
    stopped_ = true;
    workers_.join();
    {
      std::lock_guard<std::mutex> lock(mailbox_mutex_);
      has_pending_location_ = false;
      has_pending_roster_ = false;
      Roster().swap(pending_roster_);
    }
    engine_.reset();
    Roster().swap(roster_);
    has_roster_ = false;
    has_location_ = false;
    in_flight_ = false;
  }

  const EngineStats& stats() const { return stats_; }

 private:
  enum class SourceKind : uint8_t { LOCATION, ROSTER };

  void schedule_drain_locked() {
    if (drain_scheduled_) {
      return;
    }
    drain_scheduled_ = true;
    auto self = shared_from_this();
    boost::asio::post(strand_, [self]() { self->drain(); });
  }

  void post_source_error(SourceKind kind, const char* reason) {
    if (stopped_) {
      return;
    }
    auto self = shared_from_this();
    std::string text = reason ? reason : "unknown";
    boost::asio::post(strand_, [self, kind, text]() { self->handle_source_error(kind, text); });
  }

  // Strand only.
  void drain() {
    bool new_value = false;
    {
      std::lock_guard<std::mutex> lock(mailbox_mutex_);
      drain_scheduled_ = false;
      if (stopped_ || in_flight_) {
        return;
      }
      if (has_pending_location_) {
        location_ = pending_location_;
        has_location_ = true;
        has_pending_location_ = false;
        new_value = true;
      }
      if (has_pending_roster_) {
        roster_.swap(pending_roster_);
        pending_roster_.clear();
        has_roster_ = true;
        has_pending_roster_ = false;
        new_value = true;
      }
    }
    // Both sources are combined: nothing is produced before the first roster.
    if (!new_value || !has_roster_) {
      return;
    }

    in_flight_ = true;
    const int64_t now_ms = clock_.now_ms();
    auto self = shared_from_this();
    boost::asio::post(workers_, [self, now_ms]() {
      const auto started = std::chrono::steady_clock::now();
      const domain::TickOutcome outcome = self->engine_.on_tick(
          self->roster_, self->has_location_ ? &self->location_ : nullptr, now_ms);
      const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - started);
      const uint32_t elapsed_us = clamp_u32(static_cast<size_t>(elapsed.count()));
      boost::asio::post(self->strand_, [self, outcome, elapsed_us, now_ms]() {
        self->complete(outcome, elapsed_us, now_ms);
      });
    });
  }

  // Strand only. The engine is back from the worker; outcome.results points into it.
  void complete(const domain::TickOutcome& outcome, uint32_t elapsed_us, int64_t now_ms) {
    in_flight_ = false;
    if (stopped_) {
      return;
    }
    stats_.tick_count++;

    switch (outcome.path) {
      case domain::TickPath::RECOMPUTED:
        on_recomputed(outcome, elapsed_us, now_ms);
        break;
      case domain::TickPath::CACHE_REUSED:
        stats_.skip_count++;
        log_event(now_ms, domain::LogEventId::RECOMPUTE_SKIPPED, domain::LogLevel::kDebug);
        break;
      case domain::TickPath::DEGRADED_CACHED:
      case domain::TickPath::DEGRADED_PASS_THROUGH:
        on_degraded(outcome, now_ms);
        break;
    }

    if (outcome.emit && outcome.results) {
      stats_.emit_count++;
      stats_.last_result_size = clamp_u32(outcome.results->size());
      log_event_u32(now_ms, domain::LogEventId::EMIT, domain::LogLevel::kInfo,
                    stats_.last_result_size);
      sink_.on_nearby_friends(*outcome.results);
    } else {
      stats_.suppressed_count++;
      log_event(now_ms, domain::LogEventId::EMIT_SUPPRESSED, domain::LogLevel::kDebug);
      char line[kLogLineMax] = {0};
      std::snprintf(line, sizeof(line), "No change after %s tick, not emitted",
                    domain::tick_path_str(outcome.path));
      log_text(platform::LogLevel::kDebug, line);
    }

    // Values that arrived while the worker was busy.
    drain();
  }

  void on_recomputed(const domain::TickOutcome& outcome, uint32_t elapsed_us, int64_t now_ms) {
    const domain::RecomputeReport& report = outcome.report;
    const size_t result_size = outcome.results ? outcome.results->size() : 0;
    stats_.recompute_count++;
    stats_.last_recompute_us = elapsed_us;
    log_event_u32(now_ms, domain::LogEventId::RECOMPUTE, domain::LogLevel::kInfo,
                  clamp_u32(result_size));

    char line[kLogLineMax] = {0};
    std::snprintf(line, sizeof(line), "Distance updated for %lu friends (reason=%s moved=%.1fm dt=%lldms)",
                  static_cast<unsigned long>(result_size),
                  domain::recalc_reason_str(outcome.decision.reason),
                  outcome.decision.displacement_m,
                  static_cast<long long>(outcome.decision.elapsed_ms));
    log_text(platform::LogLevel::kInfo, line);

    if (report.capped) {
      stats_.capped_count++;
      log_event_u32(now_ms, domain::LogEventId::ROSTER_CAPPED, domain::LogLevel::kWarn,
                    clamp_u32(report.input_count));
      std::snprintf(line, sizeof(line), "Large friend list (%lu), limited to %lu",
                    static_cast<unsigned long>(report.input_count),
                    static_cast<unsigned long>(report.considered_count));
      log_text(platform::LogLevel::kWarn, line);
    }
    if (report.malformed_count > 0) {
      stats_.skipped_entry_count += clamp_u32(report.malformed_count);
      log_event_u32(now_ms, domain::LogEventId::ENTRY_SKIPPED, domain::LogLevel::kWarn,
                    clamp_u32(report.malformed_count));
      std::snprintf(line, sizeof(line), "Skipped %lu friends with malformed coordinates",
                    static_cast<unsigned long>(report.malformed_count));
      log_text(platform::LogLevel::kWarn, line);
    }

    const uint32_t elapsed_ms = elapsed_us / 1000U;
    if (elapsed_ms > config_.slow_recompute_threshold_ms) {
      stats_.slow_recompute_count++;
      log_event_u32(now_ms, domain::LogEventId::SLOW_RECOMPUTE, domain::LogLevel::kWarn, elapsed_ms);
      std::snprintf(line, sizeof(line), "Slow recomputation: %lums for %lu friends",
                    static_cast<unsigned long>(elapsed_ms),
                    static_cast<unsigned long>(report.considered_count));
      log_text(platform::LogLevel::kWarn, line);
    }

    std::snprintf(line, sizeof(line), "buckets very_close=%lu nearby=%lu in_town=%lu filtered=%lu",
                  static_cast<unsigned long>(report.bucket_counts[0]),
                  static_cast<unsigned long>(report.bucket_counts[1]),
                  static_cast<unsigned long>(report.bucket_counts[2]),
                  static_cast<unsigned long>(report.filtered_out_count));
    log_text(platform::LogLevel::kDebug, line);

    if (outcome.results) {
      const size_t top = result_size < kTopFriendsLogged ? result_size : kTopFriendsLogged;
      for (size_t i = 0; i < top; ++i) {
        const domain::NearbyFriendResult& r = (*outcome.results)[i];
        std::snprintf(line, sizeof(line), "#%lu %s %s score=%.3f %s",
                      static_cast<unsigned long>(i + 1), r.id.c_str(),
                      r.formatted_distance.c_str(), static_cast<double>(r.rank_score),
                      r.is_online ? "online" : "offline");
        log_text(platform::LogLevel::kDebug, line);
      }
    }
  }

  void on_degraded(const domain::TickOutcome& outcome, int64_t now_ms) {
    stats_.degraded_count++;
    log_event(now_ms, domain::LogEventId::DEGRADED_PASS_THROUGH, domain::LogLevel::kInfo);
    if (!degraded_warned_) {
      degraded_warned_ = true;
      char line[kLogLineMax] = {0};
      std::snprintf(line, sizeof(line), "User location unavailable, serving %s (%lu friends)",
                    outcome.path == domain::TickPath::DEGRADED_CACHED ? "last ranked result"
                                                                     : "friends without distances",
                    static_cast<unsigned long>(outcome.results ? outcome.results->size() : 0));
      log_text(platform::LogLevel::kWarn, line);
    }
  }

  // Strand only. A failed source is "no new tick"; the last good result stays in force.
  void handle_source_error(SourceKind kind, const std::string& reason) {
    if (stopped_) {
      return;
    }
    const bool location = kind == SourceKind::LOCATION;
    if (location) {
      stats_.location_error_count++;
    } else {
      stats_.roster_error_count++;
    }
    const int64_t now_ms = clock_.now_ms();
    log_event(now_ms,
              location ? domain::LogEventId::LOCATION_SOURCE_ERR : domain::LogEventId::ROSTER_SOURCE_ERR,
              domain::LogLevel::kError);
    char line[kLogLineMax] = {0};
    std::snprintf(line, sizeof(line), "%s source error: %s; keeping last result",
                  location ? "location" : "roster", reason.c_str());
    log_text(platform::LogLevel::kError, line);
  }

  void log_text(platform::LogLevel level, const char* msg) {
    if (text_logger_) {
      text_logger_->log(level, kLogTag, msg);
    }
  }

  void log_event(int64_t now_ms, domain::LogEventId id, domain::LogLevel level) {
    if (event_logger_) {
      event_logger_->log(now_ms, id, level);
    }
  }

  void log_event_u32(int64_t now_ms, domain::LogEventId id, domain::LogLevel level, uint32_t value) {
    if (event_logger_) {
      event_logger_->log_u32(now_ms, id, level, value);
    }
  }

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::thread_pool workers_;
  const domain::EngineConfig config_;
  const platform::IClock& clock_;
  platform::ILogger* text_logger_;
  domain::Logger* event_logger_;
  INearbyFriendsSink& sink_;

  std::atomic<bool> stopped_{false};

  // Filled by sources from any thread.
  std::mutex mailbox_mutex_;
  bool drain_scheduled_ = false;
  bool has_pending_location_ = false;
  UserLocationSample pending_location_{};
  bool has_pending_roster_ = false;
  Roster pending_roster_;

  // Owned by the strand, lent to one worker while in_flight_.
  bool in_flight_ = false;
  bool has_location_ = false;
  UserLocationSample location_{};
  bool has_roster_ = false;
  Roster roster_;
  domain::ProximityEngine engine_;
  EngineStats stats_{};
  bool degraded_warned_ = false;
};

ProximityService::ProximityService(boost::asio::io_context& io,
                                   const domain::EngineConfig& config,
                                   const platform::IClock& clock,
                                   platform::ILogger* text_logger,
                                   domain::Logger* event_logger)
    : io_(io),
      config_(config),
      clock_(clock),
      text_logger_(text_logger),
      event_logger_(event_logger) {}

ProximityService::~ProximityService() {
  unsubscribe();
}

bool ProximityService::subscribe(ILocationSource& location,
                                 IRosterSource& roster,
                                 INearbyFriendsSink& sink) {
  if (session_) {
    return false;
  }
  auto session = std::make_shared<Session>(io_, config_, clock_, text_logger_, event_logger_, sink);
  if (!roster.start(session.get())) {
    session->shutdown();
    return false;
  }
  if (!location.start(session.get())) {
    roster.stop();
    session->shutdown();
    return false;
  }
  session_ = session;
  location_ = &location;
  roster_ = &roster;
  last_stats_ = EngineStats{};
  if (event_logger_) {
    event_logger_->log(clock_.now_ms(), domain::LogEventId::SUBSCRIBE, domain::LogLevel::kInfo);
  }
  return true;
}

void ProximityService::unsubscribe() {
  if (!session_) {
    return;
  }
  if (location_) {
    location_->stop();
  }
  if (roster_) {
    roster_->stop();
  }
  location_ = nullptr;
  roster_ = nullptr;
  session_->shutdown();
  last_stats_ = session_->stats();
  session_.reset();
  if (event_logger_) {
    event_logger_->log(clock_.now_ms(), domain::LogEventId::UNSUBSCRIBE, domain::LogLevel::kInfo);
  }
}

bool ProximityService::subscribed() const {
  return session_ != nullptr;
}

EngineStats ProximityService::stats() const {
  return session_ ? session_->stats() : last_stats_;
}

} // namespace nearby
