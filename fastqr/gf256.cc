
#include "gf256.h"

#include <cstdint>

namespace fastqr {

uint8_t GF256::Pow(uint8_t base, int e) {
  if (e == 0) return 1;
  if (base == 0) return 0;
  // Reduce first so that the product can't overflow.
  int le = e % 255;
  if (le < 0) le += 255;
  return Exp(Log(base) * le);
}

}  // namespace fastqr
