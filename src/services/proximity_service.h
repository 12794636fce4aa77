#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "domain/engine_config.h"
#include "domain/logger.h"
#include "domain/nearby_friend.h"
#include "nearby/hal/interfaces.h"
#include "nearby/platform/clock.h"
#include "nearby/platform/log.h"

namespace nearby {

/** Downstream consumer. Each call carries a complete replacement list, ascending by rank. */
class INearbyFriendsSink {
 public:
  virtual ~INearbyFriendsSink() = default;
  virtual void on_nearby_friends(const domain::NearbyFriendList& results) = 0;
};

struct EngineStats {
  uint32_t tick_count = 0;
  uint32_t recompute_count = 0;
  uint32_t skip_count = 0;
  uint32_t degraded_count = 0;
  uint32_t emit_count = 0;
  uint32_t suppressed_count = 0;
  uint32_t skipped_entry_count = 0;
  uint32_t capped_count = 0;
  uint32_t slow_recompute_count = 0;
  uint32_t location_error_count = 0;
  uint32_t roster_error_count = 0;
  uint32_t last_recompute_us = 0;
  uint32_t last_result_size = 0;
};

/** Share of policy-evaluated ticks that reused the cache; 0 when nothing was evaluated. */
float throttle_ratio(const EngineStats& stats);

/**
 * Runs the proximity engine behind two push-based sources.
 *
 * Incoming values land in one latest-value slot per source; a newer value
 * overwrites an unprocessed one. Ticks are processed one at a time on a strand
 * of the given io_context; the recomputation itself runs on a worker pool and
 * the result is delivered to the sink back on the strand.
 *
 * subscribe(), unsubscribe(), stats() and the destructor must be called from
 * the thread running the io_context (or while it is not running). Sources may
 * push from any thread.
 */
class ProximityService {
 public:
  ProximityService(boost::asio::io_context& io,
                   const domain::EngineConfig& config,
                   const platform::IClock& clock,
                   platform::ILogger* text_logger,
                   domain::Logger* event_logger);
  ~ProximityService();

  ProximityService(const ProximityService&) = delete;
  ProximityService& operator=(const ProximityService&) = delete;

  /**
   * Start both sources and begin emitting to sink. Returns false when already
   * subscribed or when a source refuses to start (nothing is left running).
   */
  bool subscribe(ILocationSource& location, IRosterSource& roster, INearbyFriendsSink& sink);

  /**
   * Stop both sources, wait for an in-flight recomputation, and release all
   * engine state. No callbacks reach the sink afterwards.
   */
  void unsubscribe();

  bool subscribed() const;
  EngineStats stats() const;
  const domain::EngineConfig& config() const { return config_; }

 private:
  class Session;

  boost::asio::io_context& io_;
  domain::EngineConfig config_;
  const platform::IClock& clock_;
  platform::ILogger* text_logger_ = nullptr;
  domain::Logger* event_logger_ = nullptr;
  std::shared_ptr<Session> session_;
  ILocationSource* location_ = nullptr;
  IRosterSource* roster_ = nullptr;
  EngineStats last_stats_{};
};

} // namespace nearby
