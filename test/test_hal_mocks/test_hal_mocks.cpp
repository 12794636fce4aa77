#include <unity.h>

#include <cstring>
#include <string>

#include "nearby/hal/interfaces.h"
#include "nearby/hal/mocks/mock_clock.h"
#include "nearby/hal/mocks/mock_location_source.h"
#include "nearby/hal/mocks/mock_logger.h"
#include "nearby/hal/mocks/mock_roster_source.h"

using namespace nearby;

void setUp() {}
void tearDown() {}

namespace {

class RecordingObserver : public ILocationObserver, public IRosterObserver {
 public:
  void on_location(const UserLocationSample& sample) override {
    location_count++;
    last_sample = sample;
  }
  void on_location_error(const char* reason) override {
    location_errors++;
    last_error = reason ? reason : "";
  }
  void on_roster(const Roster& roster) override {
    roster_count++;
    last_roster_size = roster.size();
  }
  void on_roster_error(const char* reason) override {
    roster_errors++;
    last_error = reason ? reason : "";
  }

  int location_count = 0;
  int location_errors = 0;
  int roster_count = 0;
  int roster_errors = 0;
  size_t last_roster_size = 0;
  UserLocationSample last_sample{};
  std::string last_error;
};

} // namespace

void test_mock_location_source_push_and_stop() {
  MockLocationSource source;
  RecordingObserver observer;
  TEST_ASSERT_FALSE(source.push(UserLocationSample{}));
  TEST_ASSERT_TRUE(source.start(&observer));
  TEST_ASSERT_TRUE(source.started());
  TEST_ASSERT_TRUE(source.push(UserLocationSample{Coordinate{1.5, 2.5}, 42}));
  TEST_ASSERT_EQUAL_INT32(1, observer.location_count);
  TEST_ASSERT_TRUE(observer.last_sample.captured_at_ms == 42);
  TEST_ASSERT_TRUE(source.push_error("gps off"));
  TEST_ASSERT_EQUAL_STRING("gps off", observer.last_error.c_str());

  source.stop();
  TEST_ASSERT_FALSE(source.started());
  TEST_ASSERT_FALSE(source.push(UserLocationSample{}));
  TEST_ASSERT_EQUAL_UINT32(1, source.start_count());
  TEST_ASSERT_EQUAL_UINT32(1, source.stop_count());
}

void test_mock_location_source_refuses_start() {
  MockLocationSource source;
  RecordingObserver observer;
  source.set_fail_start(true);
  TEST_ASSERT_FALSE(source.start(&observer));
  TEST_ASSERT_FALSE(source.started());
  TEST_ASSERT_FALSE(source.start(nullptr));
}

void test_mock_roster_source() {
  MockRosterSource source;
  RecordingObserver observer;
  TEST_ASSERT_TRUE(source.start(&observer));
  Roster roster(3);
  TEST_ASSERT_TRUE(source.push(roster));
  TEST_ASSERT_EQUAL_UINT32(3, observer.last_roster_size);
  TEST_ASSERT_TRUE(source.push_error("backend down"));
  TEST_ASSERT_EQUAL_INT32(1, observer.roster_errors);
  source.stop();
  TEST_ASSERT_FALSE(source.push(roster));
  TEST_ASSERT_EQUAL_UINT32(1, source.stop_count());
}

void test_mock_clock() {
  MockClock clock(1000);
  TEST_ASSERT_TRUE(clock.now_ms() == 1000);
  clock.advance_ms(250);
  TEST_ASSERT_TRUE(clock.now_ms() == 1250);
  clock.sleep_ms(50);
  TEST_ASSERT_TRUE(clock.now_ms() == 1300);
  clock.set_ms(1700000000000LL);
  TEST_ASSERT_TRUE(clock.now_ms() == 1700000000000LL);
}

void test_mock_logger() {
  MockLogger log;
  log.log(platform::LogLevel::kWarn, "nearby", "slow");
  log.log(platform::LogLevel::kInfo, "app", "hello");
  TEST_ASSERT_EQUAL_STRING("app", log.last_tag());
  TEST_ASSERT_EQUAL_STRING("hello", log.last_msg());
  TEST_ASSERT_EQUAL_UINT32(2, log.count());
  TEST_ASSERT_EQUAL_UINT32(1, log.count_at(platform::LogLevel::kWarn));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_mock_location_source_push_and_stop);
  RUN_TEST(test_mock_location_source_refuses_start);
  RUN_TEST(test_mock_roster_source);
  RUN_TEST(test_mock_clock);
  RUN_TEST(test_mock_logger);
  return UNITY_END();
}
