#pragma once

#include <cstddef>

#include "nearby/hal/interfaces.h"

namespace nearby {

class MockRosterSource : public IRosterSource {
 public:
  bool start(IRosterObserver* observer) override;
  void stop() override;

  bool push(const Roster& roster);
  bool push_error(const char* reason);

  bool started() const;
  size_t stop_count() const;

 private:
  IRosterObserver* observer_ = nullptr;
  size_t stop_count_ = 0;
};

} // namespace nearby
