#include "app/app_services.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "platform/config_file.h"
#include "services/config_shell.h"

namespace nearby {

namespace {

constexpr const char* kAppVersion = "nearby-sim 0.1";
constexpr const char* kLogTag = "app";
constexpr uint32_t kSummaryPeriodMs = 10000U;
constexpr size_t kTopFriendsPrinted = 10;
constexpr size_t kMaxSimFriends = 100000;

// Around Dam Square, Amsterdam.
constexpr double kStartLatitude = 52.3731;
constexpr double kStartLongitude = 4.8926;

bool parse_u64_arg(const char* text, unsigned long long max, unsigned long long* out) {
  if (!text || !text[0] || text[0] == '-') return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (!end || *end != '\0' || v > max) return false;
  *out = v;
  return true;
}

bool option_error(char* err, size_t err_size, const char* opt, const char* what) {
  if (err && err_size > 0) {
    std::snprintf(err, err_size, "%s: %s", opt, what);
  }
  return false;
}

struct EventCounts {
  uint32_t by_id[12] = {};
};

constexpr domain::LogEventId kCountedEvents[12] = {
    domain::LogEventId::SUBSCRIBE,         domain::LogEventId::UNSUBSCRIBE,
    domain::LogEventId::RECOMPUTE,         domain::LogEventId::RECOMPUTE_SKIPPED,
    domain::LogEventId::SLOW_RECOMPUTE,    domain::LogEventId::ROSTER_CAPPED,
    domain::LogEventId::ENTRY_SKIPPED,     domain::LogEventId::DEGRADED_PASS_THROUGH,
    domain::LogEventId::EMIT,              domain::LogEventId::EMIT_SUPPRESSED,
    domain::LogEventId::LOCATION_SOURCE_ERR, domain::LogEventId::ROSTER_SOURCE_ERR,
};

void count_event(void* ctx, const domain::LogRecordView& record) {
  auto* counts = static_cast<EventCounts*>(ctx);
  for (size_t i = 0; i < 12; ++i) {
    if (kCountedEvents[i] == record.event_id) {
      counts->by_id[i]++;
      return;
    }
  }
}

} // namespace

void print_usage(const char* argv0) {
  std::printf("%s\n", kAppVersion);
  std::printf("usage: %s [--config <file>] [--profile <0-2>] [--friends <n>] [--duration-s <s>]\n"
              "       [--seed <n>] [--location-ms <ms>] [--roster-ms <ms>] [--location-error-every <n>]\n"
              "       [--verbose] [--help]\n",
              argv0 ? argv0 : "nearby_sim");
}

bool parse_app_options(int argc, char** argv, AppOptions* out, char* err, size_t err_size) {
  if (!out) return false;
  *out = AppOptions{};
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_value = (i + 1) < argc;
    unsigned long long v = 0;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      out->show_help = true;
    } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
      out->verbose = true;
    } else if (std::strcmp(arg, "--config") == 0) {
      if (!has_value) return option_error(err, err_size, arg, "missing value");
      out->config_path = argv[++i];
    } else if (std::strcmp(arg, "--profile") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], domain::kMaxProfileId, &v)) {
        return option_error(err, err_size, arg, "expected 0-2");
      }
      out->has_profile = true;
      out->profile_id = static_cast<uint32_t>(v);
    } else if (std::strcmp(arg, "--friends") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], kMaxSimFriends, &v)) {
        return option_error(err, err_size, arg, "expected 0-100000");
      }
      out->friend_count = static_cast<size_t>(v);
    } else if (std::strcmp(arg, "--duration-s") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], 86400, &v) || v == 0) {
        return option_error(err, err_size, arg, "expected 1-86400");
      }
      out->duration_s = static_cast<uint32_t>(v);
    } else if (std::strcmp(arg, "--seed") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], ~0ULL, &v)) {
        return option_error(err, err_size, arg, "expected a number");
      }
      out->seed = static_cast<uint64_t>(v);
    } else if (std::strcmp(arg, "--location-ms") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], 3600000, &v) || v == 0) {
        return option_error(err, err_size, arg, "expected 1-3600000");
      }
      out->location_period_ms = static_cast<uint32_t>(v);
    } else if (std::strcmp(arg, "--roster-ms") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], 3600000, &v) || v == 0) {
        return option_error(err, err_size, arg, "expected 1-3600000");
      }
      out->roster_period_ms = static_cast<uint32_t>(v);
    } else if (std::strcmp(arg, "--location-error-every") == 0) {
      if (!has_value || !parse_u64_arg(argv[++i], 1000000, &v)) {
        return option_error(err, err_size, arg, "expected a number");
      }
      out->location_error_every = static_cast<uint32_t>(v);
    } else {
      return option_error(err, err_size, arg, "unknown option");
    }
  }
  return true;
}

AppServices::AppServices() : summary_timer_(io_) {}

AppServices::~AppServices() {
  if (service_) {
    service_->unsubscribe();
  }
}

bool AppServices::init(const AppOptions& options) {
  options_ = options;
  logger_.set_min_level(options.verbose ? platform::LogLevel::kDebug : platform::LogLevel::kInfo);
  event_logger_.set_min_level(options.verbose ? domain::LogLevel::kDebug : domain::LogLevel::kInfo);

  domain::EngineConfig initial{};
  domain::get_profile_config(options.profile_id, &initial);
  ConfigShell shell(initial);
  if (options.has_profile) {
    char response[ConfigShell::kResponseMax] = {0};
    char line[32] = {0};
    std::snprintf(line, sizeof(line), "profile %lu", static_cast<unsigned long>(options.profile_id));
    shell.handle_line(line, response, sizeof(response));
  }
  if (options.config_path) {
    // A bad file leaves the profile configuration in force.
    std::string text;
    char err[128] = {0};
    ConfigShell from_file = shell;
    if (!platform::read_text_file(options.config_path, &text, err, sizeof(err))) {
      logger_.log(platform::LogLevel::kError, kLogTag, err);
    } else if (!from_file.apply_text(text.c_str(), err, sizeof(err))) {
      char line[192] = {0};
      std::snprintf(line, sizeof(line), "%s: %s; using profile defaults", options.config_path, err);
      logger_.log(platform::LogLevel::kError, kLogTag, line);
    } else {
      shell = from_file;
    }
  }
  config_ = shell.config();

  char err[64] = {0};
  if (!domain::validate_engine_config(config_, err, sizeof(err))) {
    logger_.log(platform::LogLevel::kError, kLogTag, err);
    return false;
  }

  char response[ConfigShell::kResponseMax] = {0};
  shell.handle_line("show", response, sizeof(response));
  logger_.log(platform::LogLevel::kInfo, kLogTag, kAppVersion);
  logger_.log(platform::LogLevel::kInfo, kLogTag, response);

  const Coordinate start{kStartLatitude, kStartLongitude};
  location_.reset(new LocationStubService(io_, clock_, start, options.location_period_ms, options.seed));
  location_->set_error_every(options.location_error_every);
  roster_.reset(new RosterStubService(io_, clock_, start, options.friend_count,
                                      options.roster_period_ms, options.seed + 1));
  service_.reset(new ProximityService(io_, config_, clock_, &logger_, &event_logger_));
  return true;
}

int AppServices::run() {
  if (!service_) {
    return 1;
  }
  if (!service_->subscribe(*location_, *roster_, *this)) {
    logger_.log(platform::LogLevel::kError, kLogTag, "subscribe failed");
    return 1;
  }
  arm_summary();
  io_.run_for(std::chrono::seconds(options_.duration_s));

  service_->unsubscribe();
  summary_timer_.cancel();
  log_summary();
  log_event_counts();
  return 0;
}

void AppServices::on_nearby_friends(const domain::NearbyFriendList& results) {
  emissions_printed_++;
  std::printf("--- update #%lu: %lu friends nearby\n",
              static_cast<unsigned long>(emissions_printed_),
              static_cast<unsigned long>(results.size()));
  const size_t top = results.size() < kTopFriendsPrinted ? results.size() : kTopFriendsPrinted;
  for (size_t i = 0; i < top; ++i) {
    const domain::NearbyFriendResult& r = results[i];
    std::printf("%3lu. %-16s %-10s %-10s %s score=%.3f\n",
                static_cast<unsigned long>(i + 1),
                r.display_name.c_str(),
                r.formatted_distance.empty() ? "?" : r.formatted_distance.c_str(),
                domain::proximity_bucket_str(r.bucket),
                r.is_online ? "online " : "offline",
                static_cast<double>(r.rank_score));
  }
  std::fflush(stdout);
}

void AppServices::arm_summary() {
  summary_timer_.expires_after(std::chrono::milliseconds(kSummaryPeriodMs));
  summary_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    log_summary();
    arm_summary();
  });
}

void AppServices::log_summary() {
  const EngineStats s = service_->stats();
  char line[192] = {0};
  std::snprintf(line, sizeof(line),
                "ticks=%lu recomputed=%lu skipped=%lu throttled=%.0f%% emitted=%lu suppressed=%lu "
                "degraded=%lu slow=%lu last_us=%lu loc_err=%lu roster_err=%lu",
                static_cast<unsigned long>(s.tick_count),
                static_cast<unsigned long>(s.recompute_count),
                static_cast<unsigned long>(s.skip_count),
                static_cast<double>(throttle_ratio(s) * 100.0f),
                static_cast<unsigned long>(s.emit_count),
                static_cast<unsigned long>(s.suppressed_count),
                static_cast<unsigned long>(s.degraded_count),
                static_cast<unsigned long>(s.slow_recompute_count),
                static_cast<unsigned long>(s.last_recompute_us),
                static_cast<unsigned long>(s.location_error_count),
                static_cast<unsigned long>(s.roster_error_count));
  logger_.log(platform::LogLevel::kInfo, kLogTag, line);
}

void AppServices::log_event_counts() {
  EventCounts counts{};
  event_logger_.for_each_record(&count_event, &counts);
  char line[192] = {0};
  std::snprintf(line, sizeof(line),
                "event ring: records=%lu dropped=%lu filtered=%lu recompute=%lu skipped=%lu emit=%lu suppressed=%lu",
                static_cast<unsigned long>(event_logger_.record_count()),
                static_cast<unsigned long>(event_logger_.dropped_count()),
                static_cast<unsigned long>(event_logger_.filtered_count()),
                static_cast<unsigned long>(counts.by_id[2]),
                static_cast<unsigned long>(counts.by_id[3]),
                static_cast<unsigned long>(counts.by_id[8]),
                static_cast<unsigned long>(counts.by_id[9]));
  logger_.log(platform::LogLevel::kInfo, kLogTag, line);
}

} // namespace nearby
