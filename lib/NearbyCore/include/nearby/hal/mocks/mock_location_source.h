#pragma once

#include <cstddef>

#include "nearby/hal/interfaces.h"

namespace nearby {

class MockLocationSource : public ILocationSource {
 public:
  bool start(ILocationObserver* observer) override;
  void stop() override;

  /** Push a sample to the observer; returns false when not started. */
  bool push(const UserLocationSample& sample);
  bool push_error(const char* reason);

  void set_fail_start(bool fail);
  bool started() const;
  size_t start_count() const;
  size_t stop_count() const;

 private:
  ILocationObserver* observer_ = nullptr;
  bool fail_start_ = false;
  size_t start_count_ = 0;
  size_t stop_count_ = 0;
};

} // namespace nearby
