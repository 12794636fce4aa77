/**
 * @file console_logger.h
 * @brief stderr-backed logger implementation.
 */
#pragma once

#include <mutex>

#include "nearby/platform/log.h"

namespace nearby::platform {

/**
 * @brief Console logger: one "[LEVEL] tag: msg" line per call on stderr.
 * Messages below the minimum level are dropped.
 */
class ConsoleLogger final : public ILogger {
 public:
  explicit ConsoleLogger(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  void log(LogLevel level, const char* tag, const char* msg) override;
  void set_min_level(LogLevel level) { min_level_ = level; }

 private:
  std::mutex mutex_;
  LogLevel min_level_;
};

const char* log_level_str(LogLevel level);

} // namespace nearby::platform
