#include "nearby/hal/mocks/mock_logger.h"

#include <cstring>

namespace nearby {

namespace {

void copy_cstr(char* out, size_t cap, const char* in) {
  if (in) {
    std::strncpy(out, in, cap - 1);
    out[cap - 1] = '\0';
  } else {
    out[0] = '\0';
  }
}

} // namespace

void MockLogger::log(platform::LogLevel level, const char* tag, const char* msg) {
  copy_cstr(last_tag_, sizeof(last_tag_), tag);
  copy_cstr(last_msg_, sizeof(last_msg_), msg);
  last_level_ = level;
  count_++;
  const size_t index = static_cast<size_t>(level);
  if (index < 4) {
    level_counts_[index]++;
  }
}

const char* MockLogger::last_tag() const {
  return last_tag_;
}

const char* MockLogger::last_msg() const {
  return last_msg_;
}

platform::LogLevel MockLogger::last_level() const {
  return last_level_;
}

size_t MockLogger::count() const {
  return count_;
}

size_t MockLogger::count_at(platform::LogLevel level) const {
  const size_t index = static_cast<size_t>(level);
  return index < 4 ? level_counts_[index] : 0;
}

} // namespace nearby
