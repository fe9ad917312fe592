// Reed-Solomon error correction codewords over GF(256), as used by
// QR codes: the generator of degree k has roots 2^0 ... 2^(k-1).

#ifndef FASTQR_REED_SOLOMON_H_
#define FASTQR_REED_SOLOMON_H_

#include <cstdint>
#include <span>
#include <vector>

namespace fastqr {

struct ReedSolomon {
  // The standard only uses 7 to 30 ECC codewords per block, but any
  // degree in this range works.
  static constexpr int MIN_DEGREE = 1;
  static constexpr int MAX_DEGREE = 30;

  // The monic generator polynomial of the given degree, coefficients
  // from the highest power down, omitting the leading 1. So the
  // result has exactly degree entries. All generators are computed
  // once, on first use. Degree out of range is a fatal error.
  static const std::vector<uint8_t> &Generator(int degree);

  // Returns exactly degree ECC codewords for the data: the remainder
  // of data(x) * x^degree divided by the generator.
  static std::vector<uint8_t> Encode(std::span<const uint8_t> data,
                                     int degree);

  // Same, writing the degree codewords to out.
  static void EncodeTo(std::span<const uint8_t> data,
                       int degree,
                       uint8_t *out);

  // Evaluates the polynomial (highest power first) at x. Used for
  // checking codewords against the generator's roots.
  static uint8_t Evaluate(std::span<const uint8_t> poly, uint8_t x);

 private:
  static std::vector<uint8_t> ComputeGenerator(int degree);

  ReedSolomon() = delete;
};

}  // namespace fastqr

#endif
