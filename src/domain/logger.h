#pragma once

#include <cstddef>
#include <cstdint>

#include "domain/log_events.h"

namespace nearby {
namespace domain {

enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogRecordView {
  int64_t t_ms;
  LogEventId event_id;
  LogLevel level;
  const uint8_t* payload;
  uint8_t len;
};

using RecordCallback = void (*)(void* ctx, const LogRecordView& record);

/**
 * Binary event log in a caller-provided (or built-in) ring buffer.
 * Record layout, little-endian: t_ms (8) | event_id (2) | level (1) | len (1) | payload.
 * When full, the oldest records are dropped. Records below the minimum level
 * are discarded on entry. Not thread-safe.
 */
class Logger {
 public:
  static constexpr size_t kDefaultRingSize = 4096;

  Logger();
  Logger(uint8_t* storage, size_t capacity);

  bool log(int64_t t_ms, LogEventId event_id, LogLevel level);
  bool log(int64_t t_ms,
           LogEventId event_id,
           LogLevel level,
           const uint8_t* payload,
           uint8_t len);
  /** Convenience: one u32 payload value, little-endian. */
  bool log_u32(int64_t t_ms, LogEventId event_id, LogLevel level, uint32_t value);

  /** Default kDebug (keep everything). */
  void set_min_level(LogLevel level) { min_level_ = level; }
  LogLevel min_level() const { return min_level_; }
  /** Records discarded by the level filter. */
  uint32_t filtered_count() const { return filtered_; }

  size_t size() const;
  size_t capacity() const;
  size_t record_count() const;
  /** Records evicted to make room since construction or the last clear(). */
  uint32_t dropped_count() const;
  void clear();

  void for_each_record(RecordCallback cb, void* ctx) const;
  void drain(RecordCallback cb, void* ctx);
  size_t copy_raw(uint8_t* out, size_t max_len) const;

 private:
  static constexpr size_t kHeaderSize = 12;

  bool ensure_space(size_t record_size);
  void drop_oldest();

  uint8_t read_byte(size_t index) const;
  void read_bytes(size_t index, uint8_t* out, size_t len) const;
  void write_bytes(const uint8_t* data, size_t len);

  uint8_t* buffer_ = nullptr;
  size_t capacity_ = 0;
  size_t head_ = 0;
  size_t tail_ = 0;
  size_t size_ = 0;
  size_t records_ = 0;
  uint32_t dropped_ = 0;
  uint32_t filtered_ = 0;
  LogLevel min_level_ = LogLevel::kDebug;
  uint8_t storage_[kDefaultRingSize] = {};
};

} // namespace domain
} // namespace nearby
