#pragma once

#include <cstddef>
#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "nearby/hal/interfaces.h"
#include "nearby/platform/clock.h"

namespace nearby {

/// Simulated friend roster for the demo. Friends are scattered up to ~15 km
/// around a center (so some fall outside the default radius); a few never
/// report a location. Every period a handful drift, go on/offline, and the
/// full roster is pushed again.
class RosterStubService : public IRosterSource {
 public:
  RosterStubService(boost::asio::io_context& io,
                    const platform::IClock& clock,
                    const Coordinate& center,
                    size_t friend_count,
                    uint32_t period_ms,
                    uint64_t seed);

  bool start(IRosterObserver* observer) override;
  void stop() override;

  const Roster& roster() const { return roster_; }

 private:
  void populate();
  void mutate();
  void arm();

  boost::asio::steady_timer timer_;
  const platform::IClock& clock_;
  IRosterObserver* observer_ = nullptr;
  Coordinate center_{};
  size_t friend_count_ = 0;
  uint32_t period_ms_ = 5000;
  uint32_t rng_state_ = 0;
  Roster roster_;
};

} // namespace nearby
