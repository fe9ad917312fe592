#include "bitbuffer.h"

#include <vector>
#include <cstdint>

#include "base/logging.h"

using namespace std;

std::vector<uint8_t> BitBuffer::GetBytes() const {
  return bytes;
}

void BitBuffer::Reserve(int64_t bits) {
  bytes.reserve(Ceil(bits));
}

void BitBuffer::WriteBit(bool bit) {
  if ((num_bits & 7) == 0) {
    bytes.push_back(0x00);
  }

  if (bit) {
    bytes[num_bits >> 3] |= (1 << (7 - (num_bits & 7)));
  }
  num_bits++;
}

void BitBuffer::WriteBits(int n, uint32_t b) {
  CHECK(n >= 0 && n <= 32) << n;
  CHECK(n == 32 || (b >> n) == 0) << "Value " << b
                                  << " does not fit in " << n << " bits";
  for (int i = n - 1; i >= 0; i--) {
    WriteBit(!!((b >> i) & 1));
  }
}

void BitBuffer::Append(const BitBuffer &other) {
  if ((num_bits & 7) == 0) {
    // Byte aligned, so the other buffer's padding is exactly ours.
    bytes.insert(bytes.end(), other.bytes.begin(), other.bytes.end());
    num_bits += other.num_bits;
    return;
  }

  Reserve(num_bits + other.num_bits);
  for (int64_t i = 0; i < other.num_bits; i++)
    WriteBit(other.Bit(i));
}
