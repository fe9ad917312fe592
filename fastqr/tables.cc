
#include "tables.h"

#include <array>
#include <span>

#include "base/logging.h"

namespace fastqr {

namespace {

struct VersionInfo {
  int total_codewords;
  int remainder_bits;
  // Indexed by ECL.
  std::array<int, 4> ecc_per_block;
  std::array<int, 4> num_blocks;
};

// Table 1 and Table 9 of the standard, one row per version starting
// at version 1.
static constexpr std::array<VersionInfo, MAX_VERSION> VERSION_INFO = {{
  // total, remainder, ECC per block (L, M, Q, H), blocks (L, M, Q, H)
  {  26, 0, { 7, 10, 13, 17}, { 1,  1,  1,  1}},  // 1
  {  44, 7, {10, 16, 22, 28}, { 1,  1,  1,  1}},  // 2
  {  70, 7, {15, 26, 18, 22}, { 1,  1,  2,  2}},  // 3
  { 100, 7, {20, 18, 26, 16}, { 1,  2,  2,  4}},  // 4
  { 134, 7, {26, 24, 18, 22}, { 1,  2,  4,  4}},  // 5
  { 172, 7, {18, 16, 24, 28}, { 2,  4,  4,  4}},  // 6
  { 196, 0, {20, 18, 18, 26}, { 2,  4,  6,  5}},  // 7
  { 242, 0, {24, 22, 22, 26}, { 2,  4,  6,  6}},  // 8
  { 292, 0, {30, 22, 20, 24}, { 2,  5,  8,  8}},  // 9
  { 346, 0, {18, 26, 24, 28}, { 4,  5,  8,  8}},  // 10
  { 404, 0, {20, 30, 28, 24}, { 4,  5,  8, 11}},  // 11
  { 466, 0, {24, 22, 26, 28}, { 4,  8, 10, 11}},  // 12
  { 532, 0, {26, 22, 24, 22}, { 4,  9, 12, 16}},  // 13
  { 581, 3, {30, 24, 20, 24}, { 4,  9, 16, 16}},  // 14
  { 655, 3, {22, 24, 30, 24}, { 6, 10, 12, 18}},  // 15
  { 733, 3, {24, 28, 24, 30}, { 6, 10, 17, 16}},  // 16
  { 815, 3, {28, 28, 28, 28}, { 6, 11, 16, 19}},  // 17
  { 901, 3, {30, 26, 28, 28}, { 6, 13, 18, 21}},  // 18
  { 991, 3, {28, 26, 26, 26}, { 7, 14, 21, 25}},  // 19
  {1085, 3, {28, 26, 30, 28}, { 8, 16, 20, 25}},  // 20
  {1156, 4, {28, 26, 28, 30}, { 8, 17, 23, 25}},  // 21
  {1258, 4, {28, 28, 30, 24}, { 9, 17, 23, 34}},  // 22
  {1364, 4, {30, 28, 30, 30}, { 9, 18, 25, 30}},  // 23
  {1474, 4, {30, 28, 30, 30}, {10, 20, 27, 32}},  // 24
  {1588, 4, {26, 28, 30, 30}, {12, 21, 29, 35}},  // 25
  {1706, 4, {28, 28, 28, 30}, {12, 23, 34, 37}},  // 26
  {1828, 4, {30, 28, 30, 30}, {12, 25, 34, 40}},  // 27
  {1921, 3, {30, 28, 30, 30}, {13, 26, 35, 42}},  // 28
  {2051, 3, {30, 28, 30, 30}, {14, 28, 38, 45}},  // 29
  {2185, 3, {30, 28, 30, 30}, {15, 29, 40, 48}},  // 30
  {2323, 3, {30, 28, 30, 30}, {16, 31, 43, 51}},  // 31
  {2465, 3, {30, 28, 30, 30}, {17, 33, 45, 54}},  // 32
  {2611, 3, {30, 28, 30, 30}, {18, 35, 48, 57}},  // 33
  {2761, 3, {30, 28, 30, 30}, {19, 37, 51, 60}},  // 34
  {2876, 0, {30, 28, 30, 30}, {19, 38, 53, 63}},  // 35
  {3034, 0, {30, 28, 30, 30}, {20, 40, 56, 66}},  // 36
  {3196, 0, {30, 28, 30, 30}, {21, 43, 59, 70}},  // 37
  {3362, 0, {30, 28, 30, 30}, {22, 45, 62, 74}},  // 38
  {3532, 0, {30, 28, 30, 30}, {24, 47, 65, 77}},  // 39
  {3706, 0, {30, 28, 30, 30}, {25, 49, 68, 81}},  // 40
}};

struct AlignmentRow {
  int count;
  std::array<int, 7> centers;
};

// Annex E.
static constexpr std::array<AlignmentRow, MAX_VERSION> ALIGNMENT = {{
  {0, {}},  // 1
  {2, {6, 18}},  // 2
  {2, {6, 22}},  // 3
  {2, {6, 26}},  // 4
  {2, {6, 30}},  // 5
  {2, {6, 34}},  // 6
  {3, {6, 22, 38}},  // 7
  {3, {6, 24, 42}},  // 8
  {3, {6, 26, 46}},  // 9
  {3, {6, 28, 50}},  // 10
  {3, {6, 30, 54}},  // 11
  {3, {6, 32, 58}},  // 12
  {3, {6, 34, 62}},  // 13
  {4, {6, 26, 46, 66}},  // 14
  {4, {6, 26, 48, 70}},  // 15
  {4, {6, 26, 50, 74}},  // 16
  {4, {6, 30, 54, 78}},  // 17
  {4, {6, 30, 56, 82}},  // 18
  {4, {6, 30, 58, 86}},  // 19
  {4, {6, 34, 62, 90}},  // 20
  {5, {6, 28, 50, 72, 94}},  // 21
  {5, {6, 26, 50, 74, 98}},  // 22
  {5, {6, 30, 54, 78, 102}},  // 23
  {5, {6, 28, 54, 80, 106}},  // 24
  {5, {6, 32, 58, 84, 110}},  // 25
  {5, {6, 30, 58, 86, 114}},  // 26
  {5, {6, 34, 62, 90, 118}},  // 27
  {6, {6, 26, 50, 74, 98, 122}},  // 28
  {6, {6, 30, 54, 78, 102, 126}},  // 29
  {6, {6, 26, 52, 78, 104, 130}},  // 30
  {6, {6, 30, 56, 82, 108, 134}},  // 31
  {6, {6, 34, 60, 86, 112, 138}},  // 32
  {6, {6, 30, 58, 86, 114, 142}},  // 33
  {6, {6, 34, 62, 90, 118, 146}},  // 34
  {7, {6, 30, 54, 78, 102, 126, 150}},  // 35
  {7, {6, 24, 50, 76, 102, 128, 154}},  // 36
  {7, {6, 28, 54, 80, 106, 132, 158}},  // 37
  {7, {6, 32, 58, 84, 110, 136, 162}},  // 38
  {7, {6, 26, 54, 82, 110, 138, 166}},  // 39
  {7, {6, 30, 58, 86, 114, 142, 170}},  // 40
}};

inline const VersionInfo &Info(int version) {
  CHECK(ValidVersion(version)) << version;
  return VERSION_INFO[version - 1];
}

inline int EclIndex(ECL ecl) {
  CHECK(ValidECL(ecl)) << (int)ecl;
  return (int)ecl;
}

}  // namespace

int NumTotalCodewords(int version) {
  return Info(version).total_codewords;
}

int NumRemainderBits(int version) {
  return Info(version).remainder_bits;
}

int NumRawDataModules(int version) {
  CHECK(ValidVersion(version)) << version;
  const int side = SideLength(version);
  // Everything except the three finders with separators and format
  // areas (3 * 8 * 8 + 2 * 15 + dark module), and the two timing
  // lines between the finders.
  int modules = side * side - 3 * 64 - 31 - 2 * (side - 16);
  const int num_align = ALIGNMENT[version - 1].count;
  if (num_align > 0) {
    // Alignment patterns that don't collide with finders; the ones
    // on row or column 6 overlap the timing pattern by 5 modules.
    const int total = num_align * num_align - 3;
    const int on_timing = 2 * (num_align - 2);
    modules -= total * 25 - on_timing * 5;
  }
  if (version >= 7) modules -= 2 * 18;
  return modules;
}

int NumBlocks(int version, ECL ecl) {
  return Info(version).num_blocks[EclIndex(ecl)];
}

int EccCodewordsPerBlock(int version, ECL ecl) {
  return Info(version).ecc_per_block[EclIndex(ecl)];
}

int NumEccCodewords(int version, ECL ecl) {
  return NumBlocks(version, ecl) * EccCodewordsPerBlock(version, ecl);
}

int NumDataCodewords(int version, ECL ecl) {
  return NumTotalCodewords(version) - NumEccCodewords(version, ecl);
}

BlockStructure GetBlockStructure(int version, ECL ecl) {
  BlockStructure bs;
  bs.num_blocks = NumBlocks(version, ecl);
  bs.ecc_per_block = EccCodewordsPerBlock(version, ecl);
  const int data = NumDataCodewords(version, ecl);
  bs.short_data_len = data / bs.num_blocks;
  bs.num_short_blocks = bs.num_blocks - data % bs.num_blocks;
  return bs;
}

std::span<const int> AlignmentPatternCenters(int version) {
  CHECK(ValidVersion(version)) << version;
  const AlignmentRow &row = ALIGNMENT[version - 1];
  return std::span<const int>(row.centers.data(), row.count);
}

}  // namespace fastqr
