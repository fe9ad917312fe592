
#ifndef _CC_LIB_BITBUFFER_H
#define _CC_LIB_BITBUFFER_H

#include <vector>
#include <cstdint>

// Writes a sequence of bits to a byte stream.
//
// The first bit in the stream is the highest bit of the first byte.
// The bytes are padded with trailing zeroes, if the number of bits
// does not divide 8.

struct BitBuffer {
  /* create a new empty bit buffer */
  BitBuffer() { }

  /* Appends the n low-order bits to the bit buffer, high bit first.
     n must be in [0, 32], and the bits above n must be zero. */
  void WriteBits(int n, uint32_t thebits);
  void WriteBit(bool bit);

  /* Appends all the bits of the other buffer. */
  void Append(const BitBuffer &other);

  /* Read the bit at the given index, which must be in range. */
  bool Bit(int64_t idx) const {
    return !!(bytes[idx >> 3] & (1 << (7 - (idx & 7))));
  }

  /* Get the full contents of the buffer, padded with zeroes at the
     end if necessary. */
  std::vector<uint8_t> GetBytes() const;
  const std::vector<uint8_t> &Bytes() const { return bytes; }

  int64_t NumBits() const { return num_bits; }
  // Hint that we will want to store this many bits.
  void Reserve(int64_t bits);

  /* give the number of bytes needed to store n bits */
  static inline int64_t Ceil(int64_t bits) {
    return (bits >> 3) + !!(bits & 7);
  }

 private:
  // Always Ceil(bytes) bytes, with trailing zero bits.
  std::vector<uint8_t> bytes;
  int64_t num_bits = 0;
};

#endif
