#include "services/config_shell.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace nearby {

namespace {

enum class KeyType : uint8_t { DOUBLE, FLOAT, INT64, SIZE, U32 };

struct ConfigKey {
  const char* name;
  KeyType type;
};

constexpr ConfigKey kConfigKeys[] = {
    {"radius_m", KeyType::DOUBLE},
    {"movement_m", KeyType::DOUBLE},
    {"time_ms", KeyType::INT64},
    {"dist_tol_m", KeyType::DOUBLE},
    {"score_tol", KeyType::FLOAT},
    {"max_friends", KeyType::SIZE},
    {"w_proximity", KeyType::FLOAT},
    {"w_recency", KeyType::FLOAT},
    {"w_status", KeyType::FLOAT},
    {"recency_ms", KeyType::INT64},
    {"slow_ms", KeyType::U32},
    {"workers", KeyType::U32},
};

void split_tokens(const char* line, char* t0, size_t len0, char* t1, size_t len1, char* t2, size_t len2) {
  if (!line || len0 == 0) return;
  while (*line == ' ' || *line == '\t') line++;
  const char* p = line;
  while (*p && *p != ' ' && *p != '\t') p++;
  size_t n0 = static_cast<size_t>(p - line);
  if (n0 >= len0) n0 = len0 - 1;
  std::memcpy(t0, line, n0);
  t0[n0] = '\0';
  if (t1 && len1) {
    while (*p == ' ' || *p == '\t') p++;
    const char* start1 = p;
    while (*p && *p != ' ' && *p != '\t') p++;
    size_t n1 = static_cast<size_t>(p - start1);
    if (n1 >= len1) n1 = len1 - 1;
    std::memcpy(t1, start1, n1);
    t1[n1] = '\0';
  }
  if (t2 && len2) {
    while (*p == ' ' || *p == '\t') p++;
    size_t n2 = std::strlen(p);
    while (n2 > 0 && (p[n2 - 1] == ' ' || p[n2 - 1] == '\t' || p[n2 - 1] == '\r')) n2--;
    if (n2 >= len2) n2 = len2 - 1;
    std::memcpy(t2, p, n2);
    t2[n2] = '\0';
  }
}

const ConfigKey* find_key(const char* name) {
  for (const ConfigKey& key : kConfigKeys) {
    if (std::strcmp(key.name, name) == 0) return &key;
  }
  return nullptr;
}

void format_value(const domain::EngineConfig& c, const char* name, char* out, size_t out_size) {
  if (std::strcmp(name, "radius_m") == 0) {
    std::snprintf(out, out_size, "%.1f", c.geo_filter_radius_m);
  } else if (std::strcmp(name, "movement_m") == 0) {
    std::snprintf(out, out_size, "%.1f", c.movement_threshold_m);
  } else if (std::strcmp(name, "time_ms") == 0) {
    std::snprintf(out, out_size, "%lld", static_cast<long long>(c.time_threshold_ms));
  } else if (std::strcmp(name, "dist_tol_m") == 0) {
    std::snprintf(out, out_size, "%.2f", c.distance_tolerance_m);
  } else if (std::strcmp(name, "score_tol") == 0) {
    std::snprintf(out, out_size, "%.3f", static_cast<double>(c.score_tolerance));
  } else if (std::strcmp(name, "max_friends") == 0) {
    std::snprintf(out, out_size, "%lu", static_cast<unsigned long>(c.max_tracked_friends));
  } else if (std::strcmp(name, "w_proximity") == 0) {
    std::snprintf(out, out_size, "%.2f", static_cast<double>(c.proximity_weight));
  } else if (std::strcmp(name, "w_recency") == 0) {
    std::snprintf(out, out_size, "%.2f", static_cast<double>(c.recency_weight));
  } else if (std::strcmp(name, "w_status") == 0) {
    std::snprintf(out, out_size, "%.2f", static_cast<double>(c.status_weight));
  } else if (std::strcmp(name, "recency_ms") == 0) {
    std::snprintf(out, out_size, "%lld", static_cast<long long>(c.recency_window_ms));
  } else if (std::strcmp(name, "slow_ms") == 0) {
    std::snprintf(out, out_size, "%lu", static_cast<unsigned long>(c.slow_recompute_threshold_ms));
  } else if (std::strcmp(name, "workers") == 0) {
    std::snprintf(out, out_size, "%lu", static_cast<unsigned long>(c.worker_threads));
  } else if (out_size > 0) {
    out[0] = '\0';
  }
}

// Whole token must parse; no trailing garbage.
bool parse_number(const char* text, KeyType type, double* real, long long* integer) {
  if (!text || !text[0]) return false;
  char* end = nullptr;
  errno = 0;
  if (type == KeyType::DOUBLE || type == KeyType::FLOAT) {
    *real = std::strtod(text, &end);
  } else {
    if (text[0] == '-') return false;
    *integer = std::strtoll(text, &end, 10);
  }
  return errno == 0 && end && *end == '\0';
}

bool assign_value(domain::EngineConfig* c, const ConfigKey& key, double real, long long integer) {
  const char* name = key.name;
  if (std::strcmp(name, "radius_m") == 0) {
    c->geo_filter_radius_m = real;
  } else if (std::strcmp(name, "movement_m") == 0) {
    c->movement_threshold_m = real;
  } else if (std::strcmp(name, "time_ms") == 0) {
    c->time_threshold_ms = static_cast<int64_t>(integer);
  } else if (std::strcmp(name, "dist_tol_m") == 0) {
    c->distance_tolerance_m = real;
  } else if (std::strcmp(name, "score_tol") == 0) {
    c->score_tolerance = static_cast<float>(real);
  } else if (std::strcmp(name, "max_friends") == 0) {
    c->max_tracked_friends = static_cast<size_t>(integer);
  } else if (std::strcmp(name, "w_proximity") == 0) {
    c->proximity_weight = static_cast<float>(real);
  } else if (std::strcmp(name, "w_recency") == 0) {
    c->recency_weight = static_cast<float>(real);
  } else if (std::strcmp(name, "w_status") == 0) {
    c->status_weight = static_cast<float>(real);
  } else if (std::strcmp(name, "recency_ms") == 0) {
    c->recency_window_ms = static_cast<int64_t>(integer);
  } else if (std::strcmp(name, "slow_ms") == 0) {
    if (integer > 0xFFFFFFFFLL) return false;
    c->slow_recompute_threshold_ms = static_cast<uint32_t>(integer);
  } else if (std::strcmp(name, "workers") == 0) {
    if (integer > 0xFFFFFFFFLL) return false;
    c->worker_threads = static_cast<uint32_t>(integer);
  } else {
    return false;
  }
  return true;
}

} // namespace

bool ConfigShell::handle_line(const char* line, char* out_response, size_t out_response_size) {
  if (!line || !out_response || out_response_size == 0) return false;
  out_response[0] = '\0';

  char t0[32] = {};
  char t1[32] = {};
  char t2[32] = {};
  split_tokens(line, t0, sizeof(t0), t1, sizeof(t1), t2, sizeof(t2));

  if (std::strcmp(t0, "help") == 0) {
    std::snprintf(out_response, out_response_size,
                  "help|show|profile <0-2>|get <key>|set <key> <value>; keys: radius_m movement_m time_ms "
                  "dist_tol_m score_tol max_friends w_proximity w_recency w_status recency_ms slow_ms workers");
    return true;
  }
  if (std::strcmp(t0, "show") == 0) {
    const domain::EngineConfig& c = config_;
    std::snprintf(out_response, out_response_size,
                  "profile=%s radius_m=%.1f movement_m=%.1f time_ms=%lld dist_tol_m=%.2f score_tol=%.3f "
                  "max_friends=%lu w=%.2f/%.2f/%.2f recency_ms=%lld slow_ms=%lu workers=%lu",
                  domain::profile_name(profile_id_),
                  c.geo_filter_radius_m,
                  c.movement_threshold_m,
                  static_cast<long long>(c.time_threshold_ms),
                  c.distance_tolerance_m,
                  static_cast<double>(c.score_tolerance),
                  static_cast<unsigned long>(c.max_tracked_friends),
                  static_cast<double>(c.proximity_weight),
                  static_cast<double>(c.recency_weight),
                  static_cast<double>(c.status_weight),
                  static_cast<long long>(c.recency_window_ms),
                  static_cast<unsigned long>(c.slow_recompute_threshold_ms),
                  static_cast<unsigned long>(c.worker_threads));
    return true;
  }
  if (std::strcmp(t0, "profile") == 0) {
    char* end = nullptr;
    const unsigned long id = t1[0] ? std::strtoul(t1, &end, 10) : 0;
    if (!t1[0] || !end || *end != '\0' || id > domain::kMaxProfileId) {
      std::snprintf(out_response, out_response_size, "ERR: profile id 0-2");
      return true;
    }
    domain::EngineConfig next{};
    domain::get_profile_config(static_cast<uint32_t>(id), &next);
    // Non-policy tunables survive a profile switch.
    next.max_tracked_friends = config_.max_tracked_friends;
    next.slow_recompute_threshold_ms = config_.slow_recompute_threshold_ms;
    next.worker_threads = config_.worker_threads;
    config_ = next;
    profile_id_ = static_cast<uint32_t>(id);
    std::snprintf(out_response, out_response_size, "OK; profile=%s", domain::profile_name(profile_id_));
    return true;
  }
  if (std::strcmp(t0, "get") == 0) {
    const ConfigKey* key = t1[0] ? find_key(t1) : nullptr;
    if (!key) {
      std::snprintf(out_response, out_response_size, "ERR: unknown key (type help)");
      return true;
    }
    char value[32] = {};
    format_value(config_, key->name, value, sizeof(value));
    std::snprintf(out_response, out_response_size, "%s=%s", key->name, value);
    return true;
  }
  if (std::strcmp(t0, "set") == 0) {
    if (!t1[0] || !t2[0]) {
      std::snprintf(out_response, out_response_size, "ERR: set <key> <value>");
      return true;
    }
    const ConfigKey* key = find_key(t1);
    if (!key) {
      std::snprintf(out_response, out_response_size, "ERR: unknown key (type help)");
      return true;
    }
    double real = 0.0;
    long long integer = 0;
    if (!parse_number(t2, key->type, &real, &integer)) {
      std::snprintf(out_response, out_response_size, "ERR: bad value for %s", key->name);
      return true;
    }
    domain::EngineConfig next = config_;
    if (!assign_value(&next, *key, real, integer)) {
      std::snprintf(out_response, out_response_size, "ERR: bad value for %s", key->name);
      return true;
    }
    char reason[64] = {};
    if (!domain::validate_engine_config(next, reason, sizeof(reason))) {
      std::snprintf(out_response, out_response_size, "ERR: %s", reason);
      return true;
    }
    config_ = next;
    char value[32] = {};
    format_value(config_, key->name, value, sizeof(value));
    std::snprintf(out_response, out_response_size, "OK; %s=%s", key->name, value);
    return true;
  }
  std::snprintf(out_response, out_response_size, "ERR: unknown command (type help)");
  return true;
}

bool ConfigShell::apply_text(const char* text, char* err, size_t err_size) {
  if (!text) return true;
  const char* p = text;
  unsigned long line_no = 0;
  while (*p) {
    const char* eol = p;
    while (*eol && *eol != '\n') eol++;
    line_no++;

    char line[kLineMax] = {};
    size_t n = static_cast<size_t>(eol - p);
    if (n >= sizeof(line)) n = sizeof(line) - 1;
    std::memcpy(line, p, n);
    line[n] = '\0';
    char* hash = std::strchr(line, '#');
    if (hash) *hash = '\0';
    p = *eol ? eol + 1 : eol;

    const char* q = line;
    while (*q == ' ' || *q == '\t' || *q == '\r') q++;
    if (!*q) continue;

    char response[kResponseMax] = {};
    handle_line(q, response, sizeof(response));
    if (std::strncmp(response, "ERR", 3) == 0) {
      if (err && err_size > 0) {
        std::snprintf(err, err_size, "line %lu: %s", line_no, response);
      }
      return false;
    }
  }
  return true;
}

} // namespace nearby
