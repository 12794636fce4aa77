#include "nearby/hal/mocks/mock_roster_source.h"

namespace nearby {

bool MockRosterSource::start(IRosterObserver* observer) {
  if (!observer) {
    return false;
  }
  observer_ = observer;
  return true;
}

void MockRosterSource::stop() {
  observer_ = nullptr;
  stop_count_++;
}

bool MockRosterSource::push(const Roster& roster) {
  if (!observer_) {
    return false;
  }
  observer_->on_roster(roster);
  return true;
}

bool MockRosterSource::push_error(const char* reason) {
  if (!observer_) {
    return false;
  }
  observer_->on_roster_error(reason);
  return true;
}

bool MockRosterSource::started() const {
  return observer_ != nullptr;
}

size_t MockRosterSource::stop_count() const {
  return stop_count_;
}

} // namespace nearby
