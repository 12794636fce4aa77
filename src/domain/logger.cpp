#include "domain/logger.h"

#include <cstring>

namespace nearby {
namespace domain {

namespace {

void put_u16_le(uint8_t* out, uint16_t value) {
  out[0] = static_cast<uint8_t>(value & 0xFF);
  out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void put_u32_le(uint8_t* out, uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
  }
}

void put_i64_le(uint8_t* out, int64_t value) {
  const uint64_t bits = static_cast<uint64_t>(value);
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>((bits >> (8 * i)) & 0xFF);
  }
}

uint16_t get_u16_le(const uint8_t* in) {
  return static_cast<uint16_t>(in[0] | (static_cast<uint16_t>(in[1]) << 8));
}

int64_t get_i64_le(const uint8_t* in) {
  uint64_t bits = 0;
  for (int i = 0; i < 8; ++i) {
    bits |= static_cast<uint64_t>(in[i]) << (8 * i);
  }
  return static_cast<int64_t>(bits);
}

} // namespace

Logger::Logger() : buffer_(storage_), capacity_(kDefaultRingSize) {}

Logger::Logger(uint8_t* storage, size_t capacity)
    : buffer_(storage), capacity_(capacity) {}

bool Logger::log(int64_t t_ms, LogEventId event_id, LogLevel level) {
  return log(t_ms, event_id, level, nullptr, 0);
}

bool Logger::log(int64_t t_ms,
                 LogEventId event_id,
                 LogLevel level,
                 const uint8_t* payload,
                 uint8_t len) {
  if (!buffer_ || capacity_ == 0) {
    return false;
  }
  if (len > 0 && !payload) {
    return false;
  }
  if (level < min_level_) {
    filtered_++;
    return true;
  }

  const size_t record_size = kHeaderSize + len;
  if (!ensure_space(record_size)) {
    return false;
  }

  uint8_t header[kHeaderSize] = {};
  put_i64_le(header, t_ms);
  put_u16_le(header + 8, static_cast<uint16_t>(event_id));
  header[10] = static_cast<uint8_t>(level);
  header[11] = len;

  write_bytes(header, sizeof(header));
  if (len > 0) {
    write_bytes(payload, len);
  }

  size_ += record_size;
  records_++;
  return true;
}

bool Logger::log_u32(int64_t t_ms, LogEventId event_id, LogLevel level, uint32_t value) {
  uint8_t payload[4] = {};
  put_u32_le(payload, value);
  return log(t_ms, event_id, level, payload, sizeof(payload));
}

size_t Logger::size() const {
  return size_;
}

size_t Logger::capacity() const {
  return capacity_;
}

size_t Logger::record_count() const {
  return records_;
}

uint32_t Logger::dropped_count() const {
  return dropped_;
}

void Logger::clear() {
  head_ = 0;
  tail_ = 0;
  size_ = 0;
  records_ = 0;
  dropped_ = 0;
  filtered_ = 0;
}

void Logger::for_each_record(RecordCallback cb, void* ctx) const {
  if (!cb || size_ == 0) {
    return;
  }

  size_t index = tail_;
  size_t remaining = size_;

  while (remaining >= kHeaderSize) {
    uint8_t header[kHeaderSize] = {};
    read_bytes(index, header, kHeaderSize);
    const uint8_t len = header[11];
    const size_t record_size = kHeaderSize + len;
    if (record_size > remaining) {
      return;
    }

    LogRecordView record{};
    record.t_ms = get_i64_le(header);
    record.event_id = static_cast<LogEventId>(get_u16_le(header + 8));
    record.level = static_cast<LogLevel>(header[10]);
    record.len = len;

    uint8_t payload[255] = {};
    if (len > 0) {
      read_bytes((index + kHeaderSize) % capacity_, payload, len);
      record.payload = payload;
    } else {
      record.payload = nullptr;
    }

    cb(ctx, record);

    index = (index + record_size) % capacity_;
    remaining -= record_size;
  }
}

void Logger::drain(RecordCallback cb, void* ctx) {
  for_each_record(cb, ctx);
  const uint32_t dropped = dropped_;
  const uint32_t filtered = filtered_;
  clear();
  dropped_ = dropped;
  filtered_ = filtered;
}

size_t Logger::copy_raw(uint8_t* out, size_t max_len) const {
  if (!out || max_len == 0 || size_ == 0) {
    return 0;
  }
  const size_t to_copy = (size_ < max_len) ? size_ : max_len;
  read_bytes(tail_, out, to_copy);
  return to_copy;
}

bool Logger::ensure_space(size_t record_size) {
  if (record_size > capacity_) {
    return false;
  }
  while (size_ + record_size > capacity_) {
    drop_oldest();
  }
  return true;
}

void Logger::drop_oldest() {
  if (size_ < kHeaderSize) {
    clear();
    return;
  }
  const uint8_t len = read_byte((tail_ + 11) % capacity_);
  const size_t record_size = kHeaderSize + len;
  if (record_size > size_) {
    clear();
    return;
  }
  tail_ = (tail_ + record_size) % capacity_;
  size_ -= record_size;
  records_--;
  dropped_++;
}

uint8_t Logger::read_byte(size_t index) const {
  return buffer_[index % capacity_];
}

void Logger::read_bytes(size_t index, uint8_t* out, size_t len) const {
  if (len == 0) {
    return;
  }
  const size_t start = index % capacity_;
  const size_t first = (start + len <= capacity_) ? len : (capacity_ - start);
  std::memcpy(out, buffer_ + start, first);
  if (first < len) {
    std::memcpy(out + first, buffer_, len - first);
  }
}

void Logger::write_bytes(const uint8_t* data, size_t len) {
  if (len == 0) {
    return;
  }
  const size_t start = head_;
  const size_t first = (start + len <= capacity_) ? len : (capacity_ - start);
  std::memcpy(buffer_ + start, data, first);
  if (first < len) {
    std::memcpy(buffer_, data + first, len - first);
  }
  head_ = (head_ + len) % capacity_;
}

} // namespace domain
} // namespace nearby
