#include "nearby/hal/mocks/mock_location_source.h"

namespace nearby {

bool MockLocationSource::start(ILocationObserver* observer) {
  if (fail_start_ || !observer) {
    return false;
  }
  observer_ = observer;
  start_count_++;
  return true;
}

void MockLocationSource::stop() {
  observer_ = nullptr;
  stop_count_++;
}

bool MockLocationSource::push(const UserLocationSample& sample) {
  if (!observer_) {
    return false;
  }
  observer_->on_location(sample);
  return true;
}

bool MockLocationSource::push_error(const char* reason) {
  if (!observer_) {
    return false;
  }
  observer_->on_location_error(reason);
  return true;
}

void MockLocationSource::set_fail_start(bool fail) {
  fail_start_ = fail;
}

bool MockLocationSource::started() const {
  return observer_ != nullptr;
}

size_t MockLocationSource::start_count() const {
  return start_count_;
}

size_t MockLocationSource::stop_count() const {
  return stop_count_;
}

} // namespace nearby
