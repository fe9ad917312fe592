
#include "format-info.h"

#include <cstdint>

#include "base/logging.h"
#include "function-layout.h"
#include "types.h"

namespace fastqr {

// Generator polynomials of the two BCH codes.
static constexpr uint32_t FORMAT_GENERATOR = 0x537;
static constexpr uint32_t VERSION_GENERATOR = 0x1F25;
// Keeps the format word from being all zeros.
static constexpr uint32_t FORMAT_MASK = 0x5412;

// Remainder of (data << ecc_bits) divided by the generator, which has
// degree ecc_bits.
static uint32_t BchRemainder(uint32_t data, int ecc_bits, uint32_t gen) {
  uint32_t rem = data << ecc_bits;
  for (int bit = 31; bit >= ecc_bits; bit--) {
    if (rem & (1u << bit)) rem ^= gen << (bit - ecc_bits);
  }
  return rem;
}

int FormatEclBits(ECL ecl) {
  switch (ecl) {
  case ECL::L: return 0b01;
  case ECL::M: return 0b00;
  case ECL::Q: return 0b11;
  case ECL::H: return 0b10;
  }
  LOG(FATAL) << "Bad ECL " << (int)ecl;
}

uint32_t FormatBits(ECL ecl, int mask) {
  CHECK(mask >= 0 && mask < 8) << mask;
  const uint32_t data = (FormatEclBits(ecl) << 3) | mask;
  const uint32_t word =
    ((data << 10) | BchRemainder(data, 10, FORMAT_GENERATOR)) ^ FORMAT_MASK;
  CHECK((word >> 15) == 0);
  return word;
}

uint32_t VersionBits(int version) {
  CHECK(version >= 7 && version <= MAX_VERSION) << version;
  const uint32_t data = version;
  const uint32_t word = (data << 12) | BchRemainder(data, 12, VERSION_GENERATOR);
  CHECK((word >> 18) == 0);
  return word;
}

void WriteFormatInfo(ECL ecl, int mask, int version, ModuleGrid *grid) {
  CHECK(grid->Size() == SideLength(version));
  const uint32_t word = FormatBits(ecl, mask);
  for (const FormatPositions &copy : FormatInfoPositions(version)) {
    for (int i = 0; i < 15; i++) {
      const auto [x, y] = copy[i];
      grid->Set(x, y, (word >> i) & 1);
    }
  }
}

void WriteVersionInfo(int version, ModuleGrid *grid) {
  if (version < 7) return;
  CHECK(grid->Size() == SideLength(version));
  const uint32_t word = VersionBits(version);
  for (const VersionPositions &copy : VersionInfoPositions(version)) {
    for (int i = 0; i < 18; i++) {
      const auto [x, y] = copy[i];
      grid->Set(x, y, (word >> i) & 1);
    }
  }
}

}  // namespace fastqr
