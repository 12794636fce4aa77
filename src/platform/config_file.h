#pragma once

#include <cstddef>
#include <string>

namespace nearby::platform {

/** Read a whole text file. On failure writes a reason into err and returns false. */
bool read_text_file(const char* path, std::string* out, char* err, size_t err_size);

} // namespace nearby::platform
