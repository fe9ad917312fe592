// Splitting data codewords into error correction blocks, and
// interleaving the blocks into the final codeword sequence.

#ifndef FASTQR_INTERLEAVE_H_
#define FASTQR_INTERLEAVE_H_

#include <cstdint>
#include <span>
#include <vector>

#include "types.h"

namespace fastqr {

struct Block {
  std::vector<uint8_t> data;
  std::vector<uint8_t> ecc;
};

// Splits the data codewords (exactly NumDataCodewords(version, ecl)
// of them) into blocks in the standard's order, shorter blocks first,
// and computes each block's ECC codewords.
std::vector<Block> SplitBlocks(std::span<const uint8_t> data,
                               int version, ECL ecl);

// The i-th data codeword of every block for each i, then the same
// for the ECC codewords. Blocks that have run out are skipped.
std::vector<uint8_t> InterleaveBlocks(const std::vector<Block> &blocks);

// SplitBlocks then InterleaveBlocks. The result has exactly
// NumTotalCodewords(version) bytes.
std::vector<uint8_t> AddEccAndInterleave(std::span<const uint8_t> data,
                                         int version, ECL ecl);

}  // namespace fastqr

#endif
