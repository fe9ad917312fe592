
#include "types.h"

#include <optional>

namespace fastqr {

const char *ECLName(ECL ecl) {
  switch (ecl) {
  case ECL::L: return "L";
  case ECL::M: return "M";
  case ECL::Q: return "Q";
  case ECL::H: return "H";
  }
  return "?";
}

std::optional<ECL> ParseECL(char c) {
  switch (c) {
  case 'l': case 'L': return {ECL::L};
  case 'm': case 'M': return {ECL::M};
  case 'q': case 'Q': return {ECL::Q};
  case 'h': case 'H': return {ECL::H};
  default: return std::nullopt;
  }
}

const char *ModeName(Mode mode) {
  switch (mode) {
  case Mode::NUMERIC: return "numeric";
  case Mode::ALPHANUMERIC: return "alphanumeric";
  case Mode::BYTE: return "byte";
  case Mode::KANJI: return "kanji";
  }
  return "?";
}

const char *ErrorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::CONTENT_TOO_LONG: return "ContentTooLong";
  case ErrorCode::UNSUPPORTED_CHARACTER: return "UnsupportedCharacter";
  case ErrorCode::INVALID_VERSION: return "InvalidVersion";
  case ErrorCode::INVALID_ERROR_CORRECTION_LEVEL:
    return "InvalidErrorCorrectionLevel";
  case ErrorCode::INVALID_MASK: return "InvalidMask";
  case ErrorCode::INVALID_MODE: return "InvalidMode";
  }
  return "?";
}

}  // namespace fastqr
