// Small glog-style logging and assertions.
//
//   CHECK(x > 0) << "x was " << x;
//   CHECK_EQ(a, b);
//   LOG(INFO) << "Version " << v;
//   LOG(FATAL) << "Unreachable";
//
// CHECK failures and LOG(FATAL) print the message with its source
// location to stderr and abort, in all build modes. DCHECK variants
// compile to nothing when NDEBUG is defined.

#ifndef _CC_LIB_BASE_LOGGING_H
#define _CC_LIB_BASE_LOGGING_H

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

namespace logging_internal {

enum Severity {
  SEVERITY_INFO = 0,
  SEVERITY_WARNING,
  SEVERITY_ERROR,
  SEVERITY_FATAL,
};

inline const char *SeverityPrefix(Severity s) {
  switch (s) {
  case SEVERITY_INFO: return "I";
  case SEVERITY_WARNING: return "W";
  case SEVERITY_ERROR: return "E";
  case SEVERITY_FATAL: return "F";
  }
  return "?";
}

// Accumulates a message and writes it to stderr on destruction.
struct LogMessage {
  LogMessage(const char *file, int line, Severity severity) :
    file(file), line(line), severity(severity) {}

  ~LogMessage() {
    Flush();
    if (severity == SEVERITY_FATAL) abort();
  }

  std::ostream &stream() { return os; }

 protected:
  void Flush() {
    const std::string msg = os.str();
    fprintf(stderr, "[%s %s:%d] %s\n",
            SeverityPrefix(severity), file, line, msg.c_str());
    fflush(stderr);
  }

  const char *file = nullptr;
  int line = 0;
  Severity severity = SEVERITY_INFO;
  std::ostringstream os;
};

// Always aborts.
struct LogMessageFatal : public LogMessage {
  LogMessageFatal(const char *file, int line, const std::string &what) :
    LogMessage(file, line, SEVERITY_FATAL) {
    if (!what.empty()) os << what << " ";
  }

  [[noreturn]] ~LogMessageFatal() {
    Flush();
    abort();
  }
};

template<class T>
void PrintCheckValue(std::ostream &os, const T &t) {
  if constexpr (std::is_integral_v<T> && sizeof (T) == 1) {
    // Otherwise uint8_t prints as a character.
    os << (int)t;
  } else if constexpr (std::is_enum_v<T>) {
    os << (int64_t)t;
  } else if constexpr (requires(std::ostream &o, const T &v) { o << v; }) {
    os << t;
  } else {
    os << "(unprintable)";
  }
}

template<class A, class B>
std::string CheckOpMessage(const A &a, const B &b, const char *expr) {
  std::ostringstream os;
  os << "Check failed: " << expr << " (";
  PrintCheckValue(os, a);
  os << " vs. ";
  PrintCheckValue(os, b);
  os << ")";
  return os.str();
}

#define LOGGING_INTERNAL_DEFINE_CHECK_OP(name, op)                    \
  template<class A, class B>                                          \
  inline std::optional<std::string>                                   \
  Check ## name ## Impl(const A &a, const B &b, const char *expr) {   \
    if (a op b) [[likely]] return std::nullopt;                       \
    return CheckOpMessage(a, b, expr);                                \
  }

LOGGING_INTERNAL_DEFINE_CHECK_OP(EQ, ==)
LOGGING_INTERNAL_DEFINE_CHECK_OP(NE, !=)
LOGGING_INTERNAL_DEFINE_CHECK_OP(LT, <)
LOGGING_INTERNAL_DEFINE_CHECK_OP(LE, <=)
LOGGING_INTERNAL_DEFINE_CHECK_OP(GT, >)
LOGGING_INTERNAL_DEFINE_CHECK_OP(GE, >=)

#undef LOGGING_INTERNAL_DEFINE_CHECK_OP

}  // namespace logging_internal

#define LOG(severity) LOGGING_INTERNAL_LOG_ ## severity

#define LOGGING_INTERNAL_LOG_INFO                                     \
  ::logging_internal::LogMessage(                                     \
      __FILE__, __LINE__, ::logging_internal::SEVERITY_INFO).stream()
#define LOGGING_INTERNAL_LOG_WARNING                                  \
  ::logging_internal::LogMessage(                                     \
      __FILE__, __LINE__, ::logging_internal::SEVERITY_WARNING).stream()
#define LOGGING_INTERNAL_LOG_ERROR                                    \
  ::logging_internal::LogMessage(                                     \
      __FILE__, __LINE__, ::logging_internal::SEVERITY_ERROR).stream()
// Separate type so that the compiler knows this does not return.
#define LOGGING_INTERNAL_LOG_FATAL                                    \
  ::logging_internal::LogMessageFatal(__FILE__, __LINE__, "").stream()

#define CHECK(condition)                                              \
  while (!(condition))                                                \
    ::logging_internal::LogMessageFatal(                              \
        __FILE__, __LINE__,                                           \
        "Check failed: " #condition).stream()

#define LOGGING_INTERNAL_CHECK_OP(name, op, a, b)                     \
  while (std::optional<std::string> logging_internal_msg =            \
         ::logging_internal::Check ## name ## Impl(                   \
             (a), (b), #a " " #op " " #b))                            \
    ::logging_internal::LogMessageFatal(                              \
        __FILE__, __LINE__, *logging_internal_msg).stream()

#define CHECK_EQ(a, b) LOGGING_INTERNAL_CHECK_OP(EQ, ==, a, b)
#define CHECK_NE(a, b) LOGGING_INTERNAL_CHECK_OP(NE, !=, a, b)
#define CHECK_LT(a, b) LOGGING_INTERNAL_CHECK_OP(LT, <, a, b)
#define CHECK_LE(a, b) LOGGING_INTERNAL_CHECK_OP(LE, <=, a, b)
#define CHECK_GT(a, b) LOGGING_INTERNAL_CHECK_OP(GT, >, a, b)
#define CHECK_GE(a, b) LOGGING_INTERNAL_CHECK_OP(GE, >=, a, b)

#ifdef NDEBUG
// Arguments are not evaluated, but still have to typecheck.
# define LOGGING_INTERNAL_DCHECK_DISABLED(check) \
  while (false) check
# define DCHECK(condition) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK(condition))
# define DCHECK_EQ(a, b) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK_EQ(a, b))
# define DCHECK_NE(a, b) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK_NE(a, b))
# define DCHECK_LT(a, b) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK_LT(a, b))
# define DCHECK_LE(a, b) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK_LE(a, b))
# define DCHECK_GT(a, b) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK_GT(a, b))
# define DCHECK_GE(a, b) LOGGING_INTERNAL_DCHECK_DISABLED(CHECK_GE(a, b))
#else
# define DCHECK(condition) CHECK(condition)
# define DCHECK_EQ(a, b) CHECK_EQ(a, b)
# define DCHECK_NE(a, b) CHECK_NE(a, b)
# define DCHECK_LT(a, b) CHECK_LT(a, b)
# define DCHECK_LE(a, b) CHECK_LE(a, b)
# define DCHECK_GT(a, b) CHECK_GT(a, b)
# define DCHECK_GE(a, b) CHECK_GE(a, b)
#endif

#endif
