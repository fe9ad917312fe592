
#ifndef FASTQR_BITSTREAM_H_
#define FASTQR_BITSTREAM_H_

#include <cstdint>
#include <vector>

#include "bitbuffer.h"
#include "segment.h"
#include "types.h"

namespace fastqr {

// The pad codewords alternately appended after the terminator.
static constexpr uint8_t PAD_CODEWORD_1 = 0xEC;
static constexpr uint8_t PAD_CODEWORD_2 = 0x11;

// Mode indicator, count field and data of each segment, without any
// terminator or padding.
BitBuffer SegmentBits(const std::vector<Segment> &segs, int version);

// The complete data codeword sequence for the version and ECL:
// segments, up to four terminator bits, zero bits to the byte
// boundary, and alternating pad codewords. The result has exactly
// NumDataCodewords(version, ecl) bytes. The segments must fit.
std::vector<uint8_t> BuildDataCodewords(const std::vector<Segment> &segs,
                                        int version, ECL ecl);

}  // namespace fastqr

#endif
