// Encodes text or binary data as a QR Code (Model 2) symbol.
//
//   fastqr::EncodeError error;
//   std::optional<fastqr::QRCode> qr =
//     fastqr::EncodeText({.ecl = fastqr::ECL::Q}, "HELLO WORLD", &error);
//   if (!qr.has_value()) {
//     printf("%s: %s\n", ErrorCodeName(error.code), error.message.c_str());
//   }
//   for (int y = 0; y < qr->Size(); y++)
//     for (int x = 0; x < qr->Size(); x++)
//       Draw(x, y, qr->IsDark(x, y));
//
// The symbol does not include the quiet zone; renderers should leave a
// light border of at least four modules.

#ifndef FASTQR_QR_CODE_H_
#define FASTQR_QR_CODE_H_

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "function-layout.h"
#include "types.h"

namespace fastqr {

struct EncodeOptions {
  ECL ecl = ECL::M;
  // If set, the symbol has exactly this version (1-40), even if a
  // smaller one would do. Otherwise the smallest that fits is used.
  std::optional<int> version;
  // If set, the whole content is encoded as one segment in this mode.
  // Otherwise it is split into numeric, alphanumeric and byte segments
  // to minimize the length. Kanji is only used when requested, and
  // then the content must be Shift JIS double-byte characters.
  std::optional<Mode> mode;
  // If set (0-7), this mask is used instead of the one with the lowest
  // penalty.
  std::optional<int> mask;
  // Number of threads used to evaluate mask candidates. 1 or less
  // evaluates them on the calling thread.
  int max_concurrency = 1;
  // Log the chosen version, segments and mask.
  bool verbose = false;
};

struct QRCode;

// Returns nullopt if the content cannot be encoded with these options
// (see ErrorCode), filling in the error if non-null.
std::optional<QRCode> Encode(const EncodeOptions &options,
                             std::span<const uint8_t> content,
                             EncodeError *error = nullptr);

// Encodes the bytes of the string, e.g. UTF-8.
std::optional<QRCode> EncodeText(const EncodeOptions &options,
                                 std::string_view text,
                                 EncodeError *error = nullptr);

// An immutable, complete QR symbol.
struct QRCode {
  // Side length in modules, 21 to 177.
  int Size() const { return modules.Size(); }

  // Out-of-range coordinates are light.
  ModuleColor Module(int x, int y) const {
    return IsDark(x, y) ? ModuleColor::DARK : ModuleColor::LIGHT;
  }

  bool IsDark(int x, int y) const {
    if (x < 0 || y < 0 || x >= Size() || y >= Size()) return false;
    return modules.Get(x, y);
  }

  int Version() const { return version; }
  ECL ErrorCorrection() const { return ecl; }
  int Mask() const { return mask; }

  // The module grid, row major, 1 for dark.
  const ModuleGrid &Modules() const { return modules; }

 private:
  friend std::optional<QRCode> Encode(const EncodeOptions &options,
                                      std::span<const uint8_t> content,
                                      EncodeError *error);

  QRCode(int version, ECL ecl, int mask, ModuleGrid modules) :
    version(version), ecl(ecl), mask(mask), modules(std::move(modules)) {}

  int version = 0;
  ECL ecl = ECL::M;
  int mask = 0;
  ModuleGrid modules;
};

}  // namespace fastqr

#endif
