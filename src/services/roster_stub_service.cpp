#include "services/roster_stub_service.h"

#include <chrono>
#include <cmath>
#include <cstdio>

#include "utils/geo_utils.h"

namespace nearby {

namespace {

constexpr uint32_t kMaxScatterM = 15000;
constexpr uint32_t kNoLocationOneIn = 25;
constexpr int64_t kMaxIdleMs = 36LL * 60 * 60 * 1000;

} // namespace

RosterStubService::RosterStubService(boost::asio::io_context& io,
                                     const platform::IClock& clock,
                                     const Coordinate& center,
                                     size_t friend_count,
                                     uint32_t period_ms,
                                     uint64_t seed)
    : timer_(io),
      clock_(clock),
      center_(center),
      friend_count_(friend_count),
      period_ms_(period_ms == 0 ? 5000 : period_ms),
      rng_state_(static_cast<uint32_t>((seed * 2654435761u) ^ (seed >> 32))) {}

bool RosterStubService::start(IRosterObserver* observer) {
  if (!observer || observer_) {
    return false;
  }
  observer_ = observer;
  populate();
  observer_->on_roster(roster_);
  arm();
  return true;
}

void RosterStubService::stop() {
  observer_ = nullptr;
  timer_.cancel();
}

void RosterStubService::populate() {
  const int64_t now = clock_.now_ms();
  roster_.clear();
  roster_.reserve(friend_count_);
  for (size_t i = 0; i < friend_count_; ++i) {
    FriendSnapshot f;
    char buf[32] = {0};
    std::snprintf(buf, sizeof(buf), "friend-%04lu", static_cast<unsigned long>(i));
    f.id = buf;
    std::snprintf(buf, sizeof(buf), "Friend %lu", static_cast<unsigned long>(i));
    f.display_name = buf;

    const uint32_t r = lcg_next(rng_state_);
    f.has_coordinate = (r % kNoLocationOneIn) != 0;
    if (f.has_coordinate) {
      const double range_m = static_cast<double>(lcg_next(rng_state_) % kMaxScatterM);
      const double angle = deg_to_rad(lcg_next(rng_state_) % 360u);
      f.coordinate = offset_m(center_, range_m * std::sin(angle), range_m * std::cos(angle));
    }
    f.is_online = (lcg_next(rng_state_) % 3u) == 0u;
    f.last_active_at_ms = now - static_cast<int64_t>(lcg_next(rng_state_) % kMaxIdleMs);
    roster_.push_back(f);
  }
}

void RosterStubService::mutate() {
  if (roster_.empty()) {
    return;
  }
  const int64_t now = clock_.now_ms();
  const size_t changes = 1 + roster_.size() / 20;
  for (size_t n = 0; n < changes; ++n) {
    FriendSnapshot& f = roster_[lcg_next(rng_state_) % roster_.size()];
    const uint32_t r = lcg_next(rng_state_);
    if (f.has_coordinate && (r % 2u) == 0u) {
      const double step_m = 10.0 + (r % 200u);
      const double angle = deg_to_rad(lcg_next(rng_state_) % 360u);
      f.coordinate = offset_m(f.coordinate, step_m * std::sin(angle), step_m * std::cos(angle));
    } else {
      f.is_online = !f.is_online;
    }
    f.last_active_at_ms = now;
  }
}

void RosterStubService::arm() {
  timer_.expires_after(std::chrono::milliseconds(period_ms_));
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !observer_) {
      return;
    }
    mutate();
    observer_->on_roster(roster_);
    arm();
  });
}

} // namespace nearby
