// Arithmetic in GF(2^8) modulo the QR primitive polynomial
// x^8 + x^4 + x^3 + x^2 + 1 (0x11D), with generator element 2.
// Multiplication and division go through exponent/log tables that
// are computed at compile time.

#ifndef FASTQR_GF256_H_
#define FASTQR_GF256_H_

#include <array>
#include <cstdint>

#include "base/logging.h"

namespace fastqr {

namespace gf256_internal {
struct Tables {
  // Doubled, so that the sum of two logs needs no reduction.
  std::array<uint8_t, 512> exp = {};
  // log[0] is unused.
  std::array<uint8_t, 256> log = {};
};

inline constexpr Tables MakeTables(int primitive) {
  Tables t;
  int x = 1;
  for (int i = 0; i < 255; i++) {
    t.exp[i] = (uint8_t)x;
    t.exp[i + 255] = (uint8_t)x;
    t.log[x] = (uint8_t)i;
    x <<= 1;
    if (x & 0x100) x ^= primitive;
  }
  return t;
}

inline constexpr Tables TABLES = MakeTables(0x11D);
}  // namespace gf256_internal

struct GF256 {
  static constexpr int PRIMITIVE = 0x11D;

  // 2^i. Any integer i is accepted; the multiplicative group has
  // order 255.
  static inline uint8_t Exp(int i) {
    i %= 255;
    if (i < 0) i += 255;
    return gf256_internal::TABLES.exp[i];
  }

  // Discrete log base 2, in [0, 254]. a must be nonzero.
  static inline int Log(uint8_t a) {
    CHECK(a != 0) << "log(0) is undefined in GF(256)";
    return gf256_internal::TABLES.log[a];
  }

  static inline uint8_t Add(uint8_t a, uint8_t b) { return a ^ b; }

  static inline uint8_t Multiply(uint8_t a, uint8_t b) {
    if (a == 0 || b == 0) return 0;
    const gf256_internal::Tables &t = gf256_internal::TABLES;
    return t.exp[t.log[a] + t.log[b]];
  }

  // Division by zero is a programming error and aborts.
  static inline uint8_t Divide(uint8_t a, uint8_t b) {
    CHECK(b != 0) << "DivisionByZero in GF(256)";
    if (a == 0) return 0;
    const gf256_internal::Tables &t = gf256_internal::TABLES;
    return t.exp[t.log[a] + 255 - t.log[b]];
  }

  // base^e. 0^0 is 1.
  static uint8_t Pow(uint8_t base, int e);

 private:
  GF256() = delete;
};

}  // namespace fastqr

#endif
