#include "base/stringprintf.h"

#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

void StringAppendV(std::string *dst, const char *format, va_list ap) {
  // Most messages are short, so try a stack buffer first.
  char space[256];

  va_list backup_ap;
  va_copy(backup_ap, ap);
  int result = vsnprintf(space, sizeof (space), format, backup_ap);
  va_end(backup_ap);

  if (result < 0) {
    // Encoding error; leave dst alone.
    return;
  }

  if ((size_t)result < sizeof (space)) {
    dst->append(space, result);
    return;
  }

  // Now we know exactly how much room is needed.
  std::vector<char> buf(result + 1);
  va_copy(backup_ap, ap);
  result = vsnprintf(buf.data(), buf.size(), format, backup_ap);
  va_end(backup_ap);

  if (result >= 0 && (size_t)result < buf.size()) {
    dst->append(buf.data(), result);
  }
}

std::string StringPrintf(const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  std::string result;
  StringAppendV(&result, format, ap);
  va_end(ap);
  return result;
}

void StringAppendF(std::string *dst, const char *format, ...) {
  va_list ap;
  va_start(ap, format);
  StringAppendV(dst, format, ap);
  va_end(ap);
}
