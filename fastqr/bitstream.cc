
#include "bitstream.h"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "base/logging.h"
#include "bitbuffer.h"
#include "segment.h"
#include "tables.h"

namespace fastqr {

BitBuffer SegmentBits(const std::vector<Segment> &segs, int version) {
  BitBuffer bb;
  for (const Segment &seg : segs) {
    const int ccbits = CharCountBits(seg.mode, version);
    CHECK(seg.num_chars < (1 << ccbits)) << seg.num_chars << " "
                                         << ModeName(seg.mode)
                                         << " characters at version "
                                         << version;
    bb.WriteBits(4, (uint32_t)seg.mode);
    bb.WriteBits(ccbits, seg.num_chars);
    bb.Append(seg.bits);
  }
  return bb;
}

std::vector<uint8_t> BuildDataCodewords(const std::vector<Segment> &segs,
                                        int version, ECL ecl) {
  const int64_t capacity = DataCapacityBits(version, ecl);
  BitBuffer bb = SegmentBits(segs, version);
  CHECK(bb.NumBits() <= capacity) << bb.NumBits() << " bits don't fit in "
                                  << version << "-" << ECLName(ecl);
  bb.Reserve(capacity);

  // Terminator, which may be truncated if we're near capacity.
  const int term = (int)std::min<int64_t>(4, capacity - bb.NumBits());
  bb.WriteBits(term, 0);
  // To byte boundary.
  bb.WriteBits((8 - (int)(bb.NumBits() & 7)) & 7, 0);

  for (int i = 0; bb.NumBits() < capacity; i++)
    bb.WriteBits(8, (i & 1) ? PAD_CODEWORD_2 : PAD_CODEWORD_1);

  CHECK(bb.NumBits() == capacity) << bb.NumBits() << " vs " << capacity;
  return bb.GetBytes();
}

}  // namespace fastqr
