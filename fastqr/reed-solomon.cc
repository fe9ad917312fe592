
#include "reed-solomon.h"

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

#include "base/logging.h"
#include "gf256.h"

namespace fastqr {

std::vector<uint8_t> ReedSolomon::ComputeGenerator(int degree) {
  // Full coefficients, highest power first, starting with g(x) = 1.
  std::vector<uint8_t> poly = {1};
  poly.reserve(degree + 1);
  for (int i = 0; i < degree; i++) {
    // Multiply by (x - 2^i). Subtraction is the same as addition.
    const uint8_t root = GF256::Exp(i);
    poly.push_back(0);
    for (int j = (int)poly.size() - 1; j > 0; j--) {
      poly[j] ^= GF256::Multiply(poly[j - 1], root);
    }
  }
  CHECK(poly[0] == 1);
  // Drop the leading monomial.
  return std::vector<uint8_t>(poly.begin() + 1, poly.end());
}

const std::vector<uint8_t> &ReedSolomon::Generator(int degree) {
  CHECK(degree >= MIN_DEGREE && degree <= MAX_DEGREE) <<
    "Unsupported Reed-Solomon degree " << degree;
  static const std::vector<std::vector<uint8_t>> generators = []() {
      std::vector<std::vector<uint8_t>> gens(MAX_DEGREE + 1);
      for (int d = MIN_DEGREE; d <= MAX_DEGREE; d++)
        gens[d] = ComputeGenerator(d);
      return gens;
    }();
  return generators[degree];
}

void ReedSolomon::EncodeTo(std::span<const uint8_t> data,
                           int degree,
                           uint8_t *out) {
  const std::vector<uint8_t> &gen = Generator(degree);
  std::fill(out, out + degree, 0);

  // Polynomial long division, keeping only the remainder in out.
  for (uint8_t b : data) {
    const uint8_t factor = b ^ out[0];
    std::copy(out + 1, out + degree, out);
    out[degree - 1] = 0;
    if (factor == 0) continue;
    for (int i = 0; i < degree; i++) {
      out[i] ^= GF256::Multiply(gen[i], factor);
    }
  }
}

std::vector<uint8_t> ReedSolomon::Encode(std::span<const uint8_t> data,
                                         int degree) {
  std::vector<uint8_t> ecc(degree, 0);
  EncodeTo(data, degree, ecc.data());
  return ecc;
}

uint8_t ReedSolomon::Evaluate(std::span<const uint8_t> poly, uint8_t x) {
  // Horner's rule.
  uint8_t acc = 0;
  for (uint8_t c : poly) acc = GF256::Multiply(acc, x) ^ c;
  return acc;
}

}  // namespace fastqr
