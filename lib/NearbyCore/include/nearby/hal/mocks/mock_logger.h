#pragma once

#include <cstddef>
#include <cstdint>

#include "nearby/platform/log.h"

namespace nearby {

class MockLogger : public platform::ILogger {
 public:
  void log(platform::LogLevel level, const char* tag, const char* msg) override;

  const char* last_tag() const;
  const char* last_msg() const;
  platform::LogLevel last_level() const;
  size_t count() const;
  size_t count_at(platform::LogLevel level) const;

 private:
  char last_tag_[32] = {0};
  char last_msg_[160] = {0};
  platform::LogLevel last_level_ = platform::LogLevel::kDebug;
  size_t count_ = 0;
  size_t level_counts_[4] = {0, 0, 0, 0};
};

} // namespace nearby
