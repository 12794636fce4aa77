#include "services/location_stub_service.h"

#include <chrono>
#include <cmath>

#include "utils/geo_utils.h"

namespace nearby {

LocationStubService::LocationStubService(boost::asio::io_context& io,
                                         const platform::IClock& clock,
                                         const Coordinate& start,
                                         uint32_t period_ms,
                                         uint64_t seed)
    : timer_(io),
      clock_(clock),
      position_(start),
      period_ms_(period_ms == 0 ? 1000 : period_ms),
      rng_state_(static_cast<uint32_t>(seed ^ (seed >> 32))) {}

bool LocationStubService::start(ILocationObserver* observer) {
  if (!observer || observer_) {
    return false;
  }
  observer_ = observer;
  period_count_ = 0;
  // First fix right away so the engine has a location as early as possible.
  observer_->on_location(UserLocationSample{position_, clock_.now_ms()});
  arm();
  return true;
}

void LocationStubService::stop() {
  observer_ = nullptr;
  timer_.cancel();
}

void LocationStubService::arm() {
  timer_.expires_after(std::chrono::milliseconds(period_ms_));
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !observer_) {
      return;
    }
    on_timer();
  });
}

void LocationStubService::on_timer() {
  period_count_++;
  if (error_every_ != 0 && (period_count_ % error_every_) == 0) {
    observer_->on_location_error("simulated location fault");
    arm();
    return;
  }

  // Deterministic drift: sometimes under the movement threshold, mostly over.
  const uint32_t r = lcg_next(rng_state_);
  const bool small_step = (r % 4u) == 0u;
  const double step_m = small_step ? (2.0 + (r % 8u)) : (25.0 + (r % 15u));
  const double angle = deg_to_rad(lcg_next(rng_state_) % 360u);
  position_ = offset_m(position_, step_m * std::sin(angle), step_m * std::cos(angle));

  observer_->on_location(UserLocationSample{position_, clock_.now_ms()});
  arm();
}

} // namespace nearby
