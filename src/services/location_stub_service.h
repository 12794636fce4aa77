#pragma once

#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "nearby/hal/interfaces.h"
#include "nearby/platform/clock.h"

namespace nearby {

/// Simulated user location for the demo. A deterministic walk driven by an
/// asio timer: most steps are larger than the standard movement threshold,
/// some are small enough to be throttled. Optionally reports a fault every
/// Nth period instead of a sample.
class LocationStubService : public ILocationSource {
 public:
  LocationStubService(boost::asio::io_context& io,
                      const platform::IClock& clock,
                      const Coordinate& start,
                      uint32_t period_ms,
                      uint64_t seed);

  bool start(ILocationObserver* observer) override;
  void stop() override;

  /** 0 disables faults. */
  void set_error_every(uint32_t periods) { error_every_ = periods; }
  const Coordinate& position() const { return position_; }

 private:
  void arm();
  void on_timer();

  boost::asio::steady_timer timer_;
  const platform::IClock& clock_;
  ILocationObserver* observer_ = nullptr;
  Coordinate position_{};
  uint32_t period_ms_ = 1000;
  uint32_t rng_state_ = 0;
  uint32_t error_every_ = 0;
  uint32_t period_count_ = 0;
};

} // namespace nearby
