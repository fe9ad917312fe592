
#include "interleave.h"

#include <cstdint>
#include <cstdio>
#include <vector>

#include "base/logging.h"
#include "reed-solomon.h"
#include "tables.h"
#include "types.h"

using namespace fastqr;

static std::vector<uint8_t> Iota(int n) {
  std::vector<uint8_t> v(n);
  for (int i = 0; i < n; i++) v[i] = (uint8_t)i;
  return v;
}

static void TestSplit() {
  // 5-Q: 15, 15, 16, 16 data codewords, 18 ECC each.
  const std::vector<uint8_t> data = Iota(62);
  std::vector<Block> blocks = SplitBlocks(data, 5, ECL::Q);
  CHECK_EQ((int)blocks.size(), 4);
  CHECK_EQ((int)blocks[0].data.size(), 15);
  CHECK_EQ((int)blocks[1].data.size(), 15);
  CHECK_EQ((int)blocks[2].data.size(), 16);
  CHECK_EQ((int)blocks[3].data.size(), 16);
  CHECK_EQ(blocks[1].data[0], 15);
  CHECK_EQ(blocks[2].data[0], 30);
  CHECK_EQ(blocks[3].data[0], 46);
  CHECK_EQ(blocks[3].data.back(), 61);
  for (const Block &block : blocks) {
    CHECK_EQ((int)block.ecc.size(), 18);
    CHECK(block.ecc == ReedSolomon::Encode(block.data, 18));
  }
}

static void TestInterleave() {
  const std::vector<uint8_t> data = Iota(62);
  std::vector<Block> blocks = SplitBlocks(data, 5, ECL::Q);
  std::vector<uint8_t> out = InterleaveBlocks(blocks);
  CHECK_EQ((int)out.size(), NumTotalCodewords(5));

  const std::vector<uint8_t> head = {0, 15, 30, 46, 1, 16, 31, 47};
  for (int i = 0; i < (int)head.size(); i++) CHECK_EQ(out[i], head[i]) << i;
  // The short blocks are exhausted after 15 rounds; the long blocks'
  // last codewords follow.
  CHECK_EQ(out[59], 60);
  CHECK_EQ(out[60], 45);
  CHECK_EQ(out[61], 61);
  // Then ECC, round robin.
  for (int i = 0; i < 18; i++) {
    for (int b = 0; b < 4; b++) {
      CHECK_EQ(out[62 + i * 4 + b], blocks[b].ecc[i]) << i << " " << b;
    }
  }
}

static void TestSingleBlock() {
  // HELLO WORLD 1-M is one block; the output is data then ECC.
  const std::vector<uint8_t> data = {
    32, 91, 11, 120, 209, 114, 220, 77,
    67, 64, 236, 17, 236, 17, 236, 17,
  };
  std::vector<uint8_t> out = AddEccAndInterleave(data, 1, ECL::M);
  const std::vector<uint8_t> expected = {
    32, 91, 11, 120, 209, 114, 220, 77,
    67, 64, 236, 17, 236, 17, 236, 17,
    196, 35, 39, 119, 235, 215, 231, 226, 93, 23,
  };
  CHECK(out == expected);
}

static void TestAllSizes() {
  for (int v = MIN_VERSION; v <= MAX_VERSION; v++) {
    for (ECL ecl : {ECL::L, ECL::M, ECL::Q, ECL::H}) {
      const std::vector<uint8_t> data = Iota(NumDataCodewords(v, ecl));
      std::vector<uint8_t> out = AddEccAndInterleave(data, v, ecl);
      CHECK_EQ((int)out.size(), NumTotalCodewords(v));
      // Every data codeword appears once in the data part.
      std::vector<int> count(256, 0);
      int total = 0;
      for (int i = 0; i < (int)data.size(); i++) {
        count[out[i]]++;
        total++;
      }
      std::vector<int> want(256, 0);
      for (uint8_t d : data) want[d]++;
      CHECK(count == want) << v << ECLName(ecl);
      CHECK_EQ(total, NumDataCodewords(v, ecl));
    }
  }
}

int main(int argc, char **argv) {
  TestSplit();
  TestInterleave();
  TestSingleBlock();
  TestAllSizes();

  printf("OK\n");
  return 0;
}
