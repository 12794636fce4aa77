#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "domain/engine_config.h"
#include "domain/logger.h"
#include "platform/console_logger.h"
#include "platform/system_clock.h"
#include "services/location_stub_service.h"
#include "services/proximity_service.h"
#include "services/roster_stub_service.h"

namespace nearby {

struct AppOptions {
  const char* config_path = nullptr;
  bool has_profile = false;
  uint32_t profile_id = domain::kProfileStandard;
  size_t friend_count = 50;
  uint32_t duration_s = 60;
  uint64_t seed = 1;
  uint32_t location_period_ms = 2000;
  uint32_t roster_period_ms = 7000;
  uint32_t location_error_every = 0;
  bool verbose = false;
  bool show_help = false;
};

/** Parse argv. On failure writes a reason into err and returns false. */
bool parse_app_options(int argc, char** argv, AppOptions* out, char* err, size_t err_size);

void print_usage(const char* argv0);

/**
 * Demo wiring: simulated sources -> ProximityService -> stdout, all on one
 * io_context run by the calling thread.
 */
class AppServices : public INearbyFriendsSink {
 public:
  AppServices();
  ~AppServices() override;

  /** Resolve the config (profile, then file) and build the pipeline. */
  bool init(const AppOptions& options);
  /** Run for the configured duration; returns a process exit code. */
  int run();

  void on_nearby_friends(const domain::NearbyFriendList& results) override;

 private:
  void arm_summary();
  void log_summary();
  void log_event_counts();

  boost::asio::io_context io_;
  boost::asio::steady_timer summary_timer_;
  platform::SystemClock clock_;
  platform::ConsoleLogger logger_;
  domain::Logger event_logger_;
  domain::EngineConfig config_{};
  AppOptions options_{};

  // Sources are declared before the service so they outlive it.
  std::unique_ptr<LocationStubService> location_;
  std::unique_ptr<RosterStubService> roster_;
  std::unique_ptr<ProximityService> service_;
  uint32_t emissions_printed_ = 0;
};

} // namespace nearby
