#include <unity.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "../../src/services/proximity_service.h"
#include "../../src/services/proximity_service.cpp"
#include "../../src/domain/change_detector.cpp"
#include "../../src/domain/geo_filter.cpp"
#include "../../src/domain/logger.cpp"
#include "../../src/domain/nearby_friend.cpp"
#include "../../src/domain/proximity_engine.cpp"
#include "../../src/domain/ranking_scorer.cpp"
#include "../../src/domain/recalc_policy.cpp"
#include "../../src/domain/result_cache.cpp"
#include "../../src/domain/roster_fingerprint.cpp"
#include "../../src/utils/geo_utils.cpp"
#include "nearby/hal/mocks/mock_clock.h"
#include "nearby/hal/mocks/mock_location_source.h"
#include "nearby/hal/mocks/mock_logger.h"
#include "nearby/hal/mocks/mock_roster_source.h"

using namespace nearby;

void setUp() {}
void tearDown() {}

namespace {

constexpr int64_t kT0 = 1700000000000LL;
const Coordinate kHome{52.3731, 4.8926};

class RecordingSink : public INearbyFriendsSink {
 public:
  void on_nearby_friends(const domain::NearbyFriendList& results) override {
    emissions.push_back(results);
  }
  size_t count() const { return emissions.size(); }
  const domain::NearbyFriendList& last() const { return emissions.back(); }

  std::vector<domain::NearbyFriendList> emissions;
};

FriendSnapshot friend_north_of_home(const char* id, double north_m) {
  FriendSnapshot f;
  f.id = id;
  f.display_name = id;
  f.has_coordinate = true;
  f.coordinate = offset_m(kHome, 0.0, north_m);
  f.is_online = true;
  f.last_active_at_ms = kT0;
  return f;
}

Roster two_friends() {
  return Roster{friend_north_of_home("B", 2000.0), friend_north_of_home("A", 500.0)};
}

template <typename Pred>
bool run_until(boost::asio::io_context& io, Pred done, int timeout_ms = 3000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    io.restart();
    io.run_for(std::chrono::milliseconds(5));
    std::this_thread::yield();
  }
  return true;
}

// Give any stray work a chance to run; used where nothing should happen.
void settle(boost::asio::io_context& io) {
  for (int i = 0; i < 10; ++i) {
    io.restart();
    io.run_for(std::chrono::milliseconds(5));
  }
}

struct EventCounter {
  domain::LogEventId id;
  uint32_t count;
};

void count_matching(void* ctx, const domain::LogRecordView& record) {
  auto* counter = static_cast<EventCounter*>(ctx);
  if (record.event_id == counter->id) {
    counter->count++;
  }
}

uint32_t count_events(const domain::Logger& logger, domain::LogEventId id) {
  EventCounter counter{id, 0};
  logger.for_each_record(&count_matching, &counter);
  return counter.count;
}

/** Everything one service test needs, torn down in the right order. */
struct Fixture {
  explicit Fixture(const domain::EngineConfig& config = domain::EngineConfig{})
      : clock(kT0), service(io, config, clock, &text_log, &events) {}

  boost::asio::io_context io;
  MockClock clock;
  MockLogger text_log;
  domain::Logger events;
  MockLocationSource location;
  MockRosterSource roster;
  RecordingSink sink;
  ProximityService service;
};

} // namespace

void test_emits_ranked_list_once_both_sources_delivered() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  TEST_ASSERT_TRUE(f.service.subscribed());
  TEST_ASSERT_TRUE(f.location.started());
  TEST_ASSERT_TRUE(f.roster.started());

  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));

  const domain::NearbyFriendList& list = f.sink.last();
  TEST_ASSERT_EQUAL_UINT32(2, list.size());
  TEST_ASSERT_EQUAL_STRING("A", list[0].id.c_str());
  TEST_ASSERT_EQUAL_STRING("500 m", list[0].formatted_distance.c_str());
  TEST_ASSERT_EQUAL_STRING("B", list[1].id.c_str());
  TEST_ASSERT_EQUAL_STRING("2.0 km", list[1].formatted_distance.c_str());

  const EngineStats s = f.service.stats();
  TEST_ASSERT_EQUAL_UINT32(1, s.tick_count);
  TEST_ASSERT_EQUAL_UINT32(1, s.recompute_count);
  TEST_ASSERT_EQUAL_UINT32(1, s.emit_count);
  TEST_ASSERT_EQUAL_UINT32(2, s.last_result_size);
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::SUBSCRIBE));
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::RECOMPUTE));
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::EMIT));
}

void test_nothing_before_first_roster() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.location.push(UserLocationSample{kHome, kT0});
  settle(f.io);
  TEST_ASSERT_EQUAL_UINT32(0, f.sink.count());
  TEST_ASSERT_EQUAL_UINT32(0, f.service.stats().tick_count);

  // The earlier location is used as soon as the roster shows up.
  f.roster.push(two_friends());
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));
  TEST_ASSERT_EQUAL_STRING("500 m", f.sink.last()[0].formatted_distance.c_str());
}

void test_unchanged_location_is_throttled() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));

  f.clock.advance_ms(1000);
  f.location.push(UserLocationSample{kHome, kT0 + 1000});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.service.stats().tick_count == 2; }));

  const EngineStats s = f.service.stats();
  TEST_ASSERT_EQUAL_UINT32(1, s.recompute_count);
  TEST_ASSERT_EQUAL_UINT32(1, s.skip_count);
  TEST_ASSERT_EQUAL_UINT32(1, s.suppressed_count);
  TEST_ASSERT_EQUAL_UINT32(1, f.sink.count());
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, throttle_ratio(s));
  TEST_ASSERT_EQUAL(platform::LogLevel::kDebug, f.text_log.last_level());
  TEST_ASSERT_NOT_NULL(std::strstr(f.text_log.last_msg(), "cache_reused"));

  // Walking 25 m towards A is past the movement threshold.
  f.clock.advance_ms(1000);
  f.location.push(UserLocationSample{offset_m(kHome, 0.0, 25.0), kT0 + 2000});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 2; }));
  TEST_ASSERT_EQUAL_STRING("475 m", f.sink.last()[0].formatted_distance.c_str());
  TEST_ASSERT_EQUAL_UINT32(2, f.service.stats().recompute_count);
}

void test_latest_value_wins() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  // Queued before the strand runs: only the last sample matters.
  for (int i = 1; i <= 5; ++i) {
    f.location.push(UserLocationSample{offset_m(kHome, 0.0, 100.0 * i), kT0});
  }
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));
  settle(f.io);
  TEST_ASSERT_EQUAL_UINT32(1, f.service.stats().tick_count);
  TEST_ASSERT_EQUAL_STRING("A", f.sink.last()[0].id.c_str());
  // User is 500 m north, on top of A.
  TEST_ASSERT_EQUAL_STRING("0 m", f.sink.last()[0].formatted_distance.c_str());
}

void test_source_errors_keep_last_result() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));

  f.location.push_error("provider disabled");
  f.roster.push_error("backend unavailable");
  TEST_ASSERT_TRUE(run_until(f.io, [&] {
    const EngineStats s = f.service.stats();
    return s.location_error_count == 1 && s.roster_error_count == 1;
  }));
  TEST_ASSERT_EQUAL_UINT32(1, f.sink.count());
  TEST_ASSERT_TRUE(f.service.subscribed());
  TEST_ASSERT_TRUE(f.text_log.count_at(platform::LogLevel::kError) >= 2);
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::LOCATION_SOURCE_ERR));
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::ROSTER_SOURCE_ERR));

  // Sources recover; processing continues from the cached state.
  Roster changed = two_friends();
  changed[0].is_online = false;
  f.roster.push(changed);
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 2; }));
  TEST_ASSERT_FALSE(f.sink.last()[1].is_online);
}

void test_invalid_location_counts_as_error() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));

  f.location.push(UserLocationSample{Coordinate{std::numeric_limits<double>::quiet_NaN(), 4.0}, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.service.stats().location_error_count == 1; }));
  settle(f.io);
  TEST_ASSERT_EQUAL_UINT32(1, f.service.stats().tick_count);
  TEST_ASSERT_EQUAL_UINT32(1, f.sink.count());
}

void test_pass_through_without_location() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));

  const domain::NearbyFriendList& list = f.sink.last();
  TEST_ASSERT_EQUAL_UINT32(2, list.size());
  TEST_ASSERT_EQUAL_STRING("B", list[0].id.c_str());
  TEST_ASSERT_TRUE(std::isinf(list[0].distance_m));
  TEST_ASSERT_EQUAL_UINT32(1, f.service.stats().degraded_count);
  TEST_ASSERT_EQUAL_UINT32(0, f.service.stats().recompute_count);

  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 2; }));
  TEST_ASSERT_EQUAL_STRING("A", f.sink.last()[0].id.c_str());
}

void test_large_roster_logs_cap() {
  domain::EngineConfig config;
  config.max_tracked_friends = 10;
  Fixture f(config);
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  Roster roster;
  for (int i = 0; i < 15; ++i) {
    char id[8] = {0};
    std::snprintf(id, sizeof(id), "f%02d", i);
    roster.push_back(friend_north_of_home(id, 50.0 * (i + 1)));
  }
  f.roster.push(roster);
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));
  TEST_ASSERT_EQUAL_UINT32(10, f.sink.last().size());
  TEST_ASSERT_EQUAL_UINT32(1, f.service.stats().capped_count);
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::ROSTER_CAPPED));
  TEST_ASSERT_TRUE(f.text_log.count_at(platform::LogLevel::kWarn) >= 1);
}

void test_unsubscribe_stops_sources_and_emissions() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 1; }));

  f.service.unsubscribe();
  TEST_ASSERT_FALSE(f.service.subscribed());
  TEST_ASSERT_FALSE(f.location.started());
  TEST_ASSERT_FALSE(f.roster.started());
  TEST_ASSERT_EQUAL_UINT32(1, f.location.stop_count());
  TEST_ASSERT_EQUAL_UINT32(1, f.roster.stop_count());
  TEST_ASSERT_FALSE(f.location.push(UserLocationSample{offset_m(kHome, 0.0, 300.0), kT0}));
  settle(f.io);
  TEST_ASSERT_EQUAL_UINT32(1, f.sink.count());
  // Final stats survive the session.
  TEST_ASSERT_EQUAL_UINT32(1, f.service.stats().emit_count);
  TEST_ASSERT_EQUAL_UINT32(1, count_events(f.events, domain::LogEventId::UNSUBSCRIBE));

  // Second unsubscribe is a no-op; a fresh subscription starts from scratch.
  f.service.unsubscribe();
  TEST_ASSERT_EQUAL_UINT32(1, f.location.stop_count());
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  TEST_ASSERT_EQUAL_UINT32(0, f.service.stats().tick_count);
  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  TEST_ASSERT_TRUE(run_until(f.io, [&] { return f.sink.count() == 2; }));
}

void test_unsubscribe_while_recompute_queued() {
  Fixture f;
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  f.roster.push(two_friends());
  f.location.push(UserLocationSample{kHome, kT0});
  // Drain is queued on the strand but never ran.
  f.service.unsubscribe();
  settle(f.io);
  TEST_ASSERT_EQUAL_UINT32(0, f.sink.count());
}

void test_subscribe_rolls_back_on_source_failure() {
  Fixture f;
  f.location.set_fail_start(true);
  TEST_ASSERT_FALSE(f.service.subscribe(f.location, f.roster, f.sink));
  TEST_ASSERT_FALSE(f.service.subscribed());
  TEST_ASSERT_FALSE(f.roster.started());
  TEST_ASSERT_EQUAL_UINT32(1, f.roster.stop_count());

  f.location.set_fail_start(false);
  TEST_ASSERT_TRUE(f.service.subscribe(f.location, f.roster, f.sink));
  TEST_ASSERT_FALSE(f.service.subscribe(f.location, f.roster, f.sink));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_emits_ranked_list_once_both_sources_delivered);
  RUN_TEST(test_nothing_before_first_roster);
  RUN_TEST(test_unchanged_location_is_throttled);
  RUN_TEST(test_latest_value_wins);
  RUN_TEST(test_source_errors_keep_last_result);
  RUN_TEST(test_invalid_location_counts_as_error);
  RUN_TEST(test_pass_through_without_location);
  RUN_TEST(test_large_roster_logs_cap);
  RUN_TEST(test_unsubscribe_stops_sources_and_emissions);
  RUN_TEST(test_unsubscribe_while_recompute_queued);
  RUN_TEST(test_subscribe_rolls_back_on_source_failure);
  return UNITY_END();
}
