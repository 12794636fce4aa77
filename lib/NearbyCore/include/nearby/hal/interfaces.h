#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nearby {

struct Coordinate {
  double latitude = 0.0;
  double longitude = 0.0;
};

struct UserLocationSample {
  Coordinate coordinate;
  int64_t captured_at_ms = 0;
};

struct FriendSnapshot {
  std::string id;
  std::string display_name;
  bool has_coordinate = false;  // false until the friend reported a location
  Coordinate coordinate;
  bool is_online = false;
  int64_t last_active_at_ms = 0;
};

/** Full roster; delivered whole on every change, never as a diff. */
using Roster = std::vector<FriendSnapshot>;

class ILocationObserver {
 public:
  virtual ~ILocationObserver() = default;
  virtual void on_location(const UserLocationSample& sample) = 0;
  /** Source failed; no value accompanies the call. reason may be null. */
  virtual void on_location_error(const char* reason) = 0;
};

class IRosterObserver {
 public:
  virtual ~IRosterObserver() = default;
  virtual void on_roster(const Roster& roster) = 0;
  virtual void on_roster_error(const char* reason) = 0;
};

/**
 * Push-based user location stream.
 * start() may deliver from any thread; after stop() returns no further
 * callbacks are made into the observer.
 */
class ILocationSource {
 public:
  virtual ~ILocationSource() = default;
  virtual bool start(ILocationObserver* observer) = 0;
  virtual void stop() = 0;
};

/** Push-based friend roster stream. Same threading contract as ILocationSource. */
class IRosterSource {
 public:
  virtual ~IRosterSource() = default;
  virtual bool start(IRosterObserver* observer) = 0;
  virtual void stop() = 0;
};

} // namespace nearby
