#ifndef _CC_LIB_BASE_STRINGPRINTF_H
#define _CC_LIB_BASE_STRINGPRINTF_H

#include <cstdarg>
#include <string>

// Like sprintf, but returns a std::string.
std::string StringPrintf(const char *format, ...)
#ifdef __GNUC__
  __attribute__((format(printf, 1, 2)))
#endif
  ;

// Appends the formatted result to *dst.
void StringAppendF(std::string *dst, const char *format, ...)
#ifdef __GNUC__
  __attribute__((format(printf, 2, 3)))
#endif
  ;

void StringAppendV(std::string *dst, const char *format, va_list ap);

#endif
