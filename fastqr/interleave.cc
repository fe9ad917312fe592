
#include "interleave.h"

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

#include "base/logging.h"
#include "reed-solomon.h"
#include "tables.h"

namespace fastqr {

std::vector<Block> SplitBlocks(std::span<const uint8_t> data,
                               int version, ECL ecl) {
  CHECK((int)data.size() == NumDataCodewords(version, ecl))
    << data.size() << " data codewords for " << version << "-"
    << ECLName(ecl);
  const BlockStructure bs = GetBlockStructure(version, ecl);

  std::vector<Block> blocks(bs.num_blocks);
  size_t pos = 0;
  for (int b = 0; b < bs.num_blocks; b++) {
    const int len = b < bs.num_short_blocks ?
      bs.short_data_len : bs.LongDataLen();
    Block &block = blocks[b];
    block.data.assign(data.begin() + pos, data.begin() + pos + len);
    pos += len;
    block.ecc = ReedSolomon::Encode(block.data, bs.ecc_per_block);
  }
  CHECK(pos == data.size());
  return blocks;
}

std::vector<uint8_t> InterleaveBlocks(const std::vector<Block> &blocks) {
  size_t max_data = 0, max_ecc = 0, total = 0;
  for (const Block &block : blocks) {
    max_data = std::max(max_data, block.data.size());
    max_ecc = std::max(max_ecc, block.ecc.size());
    total += block.data.size() + block.ecc.size();
  }

  std::vector<uint8_t> out;
  out.reserve(total);
  for (size_t i = 0; i < max_data; i++) {
    for (const Block &block : blocks) {
      if (i < block.data.size()) out.push_back(block.data[i]);
    }
  }
  for (size_t i = 0; i < max_ecc; i++) {
    for (const Block &block : blocks) {
      if (i < block.ecc.size()) out.push_back(block.ecc[i]);
    }
  }
  return out;
}

std::vector<uint8_t> AddEccAndInterleave(std::span<const uint8_t> data,
                                         int version, ECL ecl) {
  std::vector<uint8_t> out = InterleaveBlocks(SplitBlocks(data, version, ecl));
  CHECK((int)out.size() == NumTotalCodewords(version))
    << out.size() << " vs " << NumTotalCodewords(version);
  return out;
}

}  // namespace fastqr
