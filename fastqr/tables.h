// Capacity and layout constants from ISO/IEC 18004. These are
// immutable; nothing here allocates after static initialization.

#ifndef FASTQR_TABLES_H_
#define FASTQR_TABLES_H_

#include <span>

#include "types.h"

namespace fastqr {

// How the codewords of a (version, ECL) pair are split into blocks.
// The first num_short_blocks blocks (the standard's group 1) have
// short_data_len data codewords; the rest have one more.
struct BlockStructure {
  int num_blocks = 0;
  int num_short_blocks = 0;
  int short_data_len = 0;
  int ecc_per_block = 0;

  int LongDataLen() const { return short_data_len + 1; }
  int NumLongBlocks() const { return num_blocks - num_short_blocks; }
};

// The version must be valid (CHECKed) in all of these.

// Total codewords (data + ECC) in the symbol.
int NumTotalCodewords(int version);
// Data modules left over after the last full codeword; 0 to 7.
int NumRemainderBits(int version);
// Number of modules available for codewords and remainder bits.
// Computed from the function pattern geometry, and equal to
// 8 * NumTotalCodewords + NumRemainderBits.
int NumRawDataModules(int version);

int NumBlocks(int version, ECL ecl);
int EccCodewordsPerBlock(int version, ECL ecl);
int NumEccCodewords(int version, ECL ecl);
int NumDataCodewords(int version, ECL ecl);
inline int DataCapacityBits(int version, ECL ecl) {
  return NumDataCodewords(version, ecl) * 8;
}

BlockStructure GetBlockStructure(int version, ECL ecl);

// Ascending row/column coordinates of alignment pattern centers.
// Empty for version 1.
std::span<const int> AlignmentPatternCenters(int version);

}  // namespace fastqr

#endif
