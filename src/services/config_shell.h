#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/engine_config.h"

namespace nearby {

/**
 * Line-based editor for an EngineConfig.
 * Commands: help | show | profile <0-2> | get <key> | set <key> <value>.
 * Every response starts with "OK" or "ERR:" except help/show/get which print values.
 * A set that would break validate_engine_config() is rejected and leaves the config unchanged.
 */
class ConfigShell {
 public:
  static constexpr size_t kResponseMax = 256;
  static constexpr size_t kLineMax = 128;

  ConfigShell() = default;
  explicit ConfigShell(const domain::EngineConfig& config) : config_(config) {}

  /** Parse and execute one command line. Returns true if a response was written. */
  bool handle_line(const char* line, char* out_response, size_t out_response_size);

  /**
   * Apply a multi-line script (one command per line, '#' starts a comment).
   * Stops at the first failing line; err gets "line N: <reason>". Returns false on failure.
   */
  bool apply_text(const char* text, char* err, size_t err_size);

  const domain::EngineConfig& config() const { return config_; }
  uint32_t profile_id() const { return profile_id_; }

 private:
  domain::EngineConfig config_{};
  uint32_t profile_id_ = domain::kProfileStandard;
};

} // namespace nearby
