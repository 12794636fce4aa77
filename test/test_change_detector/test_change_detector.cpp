#include <unity.h>

#include <limits>
#include <utility>

#include "../../src/domain/change_detector.h"
#include "../../src/domain/change_detector.cpp"

using nearby::domain::ChangeDetector;
using nearby::domain::EngineConfig;
using nearby::domain::NearbyFriendList;
using nearby::domain::NearbyFriendResult;

void setUp() {}
void tearDown() {}

namespace {

NearbyFriendResult entry(const char* id, double distance, float score) {
  NearbyFriendResult r;
  r.id = id;
  r.display_name = id;
  r.distance_m = distance;
  r.rank_score = score;
  r.is_online = true;
  return r;
}

NearbyFriendList two_friends() {
  return NearbyFriendList{entry("a", 500.0, 0.10f), entry("b", 2000.0, 0.30f)};
}

} // namespace

void test_sub_meter_jitter_is_suppressed() {
  ChangeDetector detector;
  NearbyFriendList next = two_friends();
  next[0].distance_m += 0.4;
  TEST_ASSERT_FALSE(detector.should_emit(two_friends(), next));
}

void test_distance_change_over_tolerance_emits() {
  ChangeDetector detector;
  NearbyFriendList next = two_friends();
  next[1].distance_m += 1.5;
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), next));
}

void test_score_change_over_tolerance_emits() {
  ChangeDetector detector;
  NearbyFriendList next = two_friends();
  next[0].rank_score += 0.005f;
  TEST_ASSERT_FALSE(detector.should_emit(two_friends(), next));
  next[0].rank_score += 0.01f;
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), next));
}

void test_size_change_emits() {
  ChangeDetector detector;
  NearbyFriendList next = two_friends();
  next.pop_back();
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), next));
  TEST_ASSERT_TRUE(detector.should_emit(NearbyFriendList{}, two_friends()));
}

void test_reorder_and_display_fields_emit() {
  ChangeDetector detector;
  NearbyFriendList swapped = two_friends();
  std::swap(swapped[0], swapped[1]);
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), swapped));

  NearbyFriendList offline = two_friends();
  offline[1].is_online = false;
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), offline));

  NearbyFriendList renamed = two_friends();
  renamed[0].display_name = "Alice";
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), renamed));
}

void test_unknown_distances_compare_equal() {
  ChangeDetector detector;
  const double inf = std::numeric_limits<double>::infinity();
  NearbyFriendList a{entry("a", inf, 1.0f)};
  NearbyFriendList b{entry("a", inf, 1.0f)};
  TEST_ASSERT_FALSE(detector.should_emit(a, b));
  b[0].distance_m = 300.0;
  TEST_ASSERT_TRUE(detector.should_emit(a, b));
}

void test_offer_compares_against_last_emission() {
  ChangeDetector detector;
  TEST_ASSERT_FALSE(detector.has_emitted());
  TEST_ASSERT_TRUE(detector.offer(NearbyFriendList{}));  // first emission, even when empty
  TEST_ASSERT_FALSE(detector.offer(NearbyFriendList{}));

  TEST_ASSERT_TRUE(detector.offer(two_friends()));
  // Drift 0.6 m twice: each step is under tolerance but the sum is not.
  NearbyFriendList step1 = two_friends();
  step1[0].distance_m += 0.6;
  TEST_ASSERT_FALSE(detector.offer(step1));
  NearbyFriendList step2 = two_friends();
  step2[0].distance_m += 1.2;
  TEST_ASSERT_TRUE(detector.offer(step2));
  TEST_ASSERT_FLOAT_WITHIN(1e-3f, 501.2f, static_cast<float>(detector.last_emitted()[0].distance_m));

  detector.reset();
  TEST_ASSERT_FALSE(detector.has_emitted());
  TEST_ASSERT_EQUAL_UINT32(0, detector.last_emitted().size());
}

void test_custom_tolerance() {
  EngineConfig config;
  config.distance_tolerance_m = 5.0;
  ChangeDetector detector(config);
  NearbyFriendList next = two_friends();
  next[0].distance_m += 4.0;
  TEST_ASSERT_FALSE(detector.should_emit(two_friends(), next));
  next[0].distance_m += 1.0;
  TEST_ASSERT_TRUE(detector.should_emit(two_friends(), next));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_sub_meter_jitter_is_suppressed);
  RUN_TEST(test_distance_change_over_tolerance_emits);
  RUN_TEST(test_score_change_over_tolerance_emits);
  RUN_TEST(test_size_change_emits);
  RUN_TEST(test_reorder_and_display_fields_emit);
  RUN_TEST(test_unknown_distances_compare_equal);
  RUN_TEST(test_offer_compares_against_last_emission);
  RUN_TEST(test_custom_tolerance);
  return UNITY_END();
}
