#include "platform/config_file.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace nearby::platform {

namespace {

constexpr size_t kMaxConfigFileBytes = 64 * 1024;

} // namespace

bool read_text_file(const char* path, std::string* out, char* err, size_t err_size) {
  if (!path || !out) {
    return false;
  }
  std::FILE* f = std::fopen(path, "rb");
  if (!f) {
    if (err && err_size > 0) {
      std::snprintf(err, err_size, "%s: %s", path, std::strerror(errno));
    }
    return false;
  }
  out->clear();
  char buf[1024];
  size_t n = 0;
  bool ok = true;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    if (out->size() + n > kMaxConfigFileBytes) {
      if (err && err_size > 0) {
        std::snprintf(err, err_size, "%s: file too large", path);
      }
      ok = false;
      break;
    }
    out->append(buf, n);
  }
  if (ok && std::ferror(f)) {
    if (err && err_size > 0) {
      std::snprintf(err, err_size, "%s: read error", path);
    }
    ok = false;
  }
  std::fclose(f);
  return ok;
}

} // namespace nearby::platform
