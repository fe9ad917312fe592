
#ifndef FASTQR_TYPES_H_
#define FASTQR_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>

namespace fastqr {

static constexpr int MIN_VERSION = 1;
static constexpr int MAX_VERSION = 40;

// Error correction level. The order matters; it indexes the
// capacity tables.
enum class ECL : uint8_t {
  L = 0,  // ~7% of codewords can be restored
  M = 1,  // ~15%
  Q = 2,  // ~25%
  H = 3,  // ~30%
};

// Segment modes. Values are the 4-bit mode indicators.
enum class Mode : uint8_t {
  NUMERIC = 0x1,
  ALPHANUMERIC = 0x2,
  BYTE = 0x4,
  KANJI = 0x8,
};

enum class ModuleColor : uint8_t {
  LIGHT = 0,
  DARK = 1,
};

// User-triggerable failures. Internal invariant violations are
// not represented here; they fail a CHECK.
enum class ErrorCode {
  CONTENT_TOO_LONG,
  UNSUPPORTED_CHARACTER,
  INVALID_VERSION,
  INVALID_ERROR_CORRECTION_LEVEL,
  INVALID_MASK,
  INVALID_MODE,
};

struct EncodeError {
  ErrorCode code = ErrorCode::CONTENT_TOO_LONG;
  std::string message;
};

inline bool ValidECL(ECL ecl) {
  return (int)ecl >= 0 && (int)ecl <= 3;
}

inline bool ValidMode(Mode mode) {
  switch (mode) {
  case Mode::NUMERIC:
  case Mode::ALPHANUMERIC:
  case Mode::BYTE:
  case Mode::KANJI:
    return true;
  }
  return false;
}

inline bool ValidVersion(int version) {
  return version >= MIN_VERSION && version <= MAX_VERSION;
}

// 4v + 17.
inline constexpr int SideLength(int version) {
  return version * 4 + 17;
}

// "L", "M", "Q", "H".
const char *ECLName(ECL ecl);
// Accepts the letter in either case.
std::optional<ECL> ParseECL(char c);

const char *ModeName(Mode mode);
const char *ErrorCodeName(ErrorCode code);

}  // namespace fastqr

#endif
