
#include "format-info.h"

#include <cstdint>
#include <cstdio>

#include "base/logging.h"
#include "function-layout.h"
#include "types.h"

using namespace fastqr;

static void TestFormatBits() {
  CHECK_EQ(FormatEclBits(ECL::L), 1);
  CHECK_EQ(FormatEclBits(ECL::M), 0);
  CHECK_EQ(FormatEclBits(ECL::Q), 3);
  CHECK_EQ(FormatEclBits(ECL::H), 2);

  CHECK_EQ(FormatBits(ECL::L, 0), 0x77C4u);
  CHECK_EQ(FormatBits(ECL::M, 0), 0x5412u);
  CHECK_EQ(FormatBits(ECL::Q, 0), 0x355Fu);
  CHECK_EQ(FormatBits(ECL::H, 0), 0x1689u);
  CHECK_EQ(FormatBits(ECL::M, 5), 0x40CEu);
  CHECK_EQ(FormatBits(ECL::L, 7), 0x6976u);

  // All 32 words are distinct, and any two differ in at least 7 bits.
  uint32_t words[32];
  int n = 0;
  for (ECL ecl : {ECL::L, ECL::M, ECL::Q, ECL::H})
    for (int mask = 0; mask < 8; mask++)
      words[n++] = FormatBits(ecl, mask);
  for (int i = 0; i < 32; i++) {
    CHECK(words[i] < (1u << 15));
    for (int j = i + 1; j < 32; j++) {
      CHECK(__builtin_popcount(words[i] ^ words[j]) >= 7) << i << " " << j;
    }
  }
}

static void TestVersionBits() {
  CHECK_EQ(VersionBits(7), 0x07C94u);
  CHECK_EQ(VersionBits(21), 0x15683u);
  CHECK_EQ(VersionBits(40), 0x28C69u);
  for (int v = 7; v <= MAX_VERSION; v++) {
    const uint32_t w = VersionBits(v);
    CHECK_EQ(w >> 12, (uint32_t)v);
    CHECK(w < (1u << 18));
  }
}

static void TestWrite() {
  for (int v : {1, 6, 7, 40}) {
    const FunctionLayout &layout = FunctionLayout::Get(v);
    ModuleGrid grid = layout.modules;
    WriteFormatInfo(ECL::Q, 3, v, &grid);
    WriteVersionInfo(v, &grid);

    const uint32_t word = FormatBits(ECL::Q, 3);
    for (const FormatPositions &copy : FormatInfoPositions(v)) {
      for (int i = 0; i < 15; i++) {
        const auto [x, y] = copy[i];
        CHECK_EQ(grid.Get(x, y), ((word >> i) & 1) == 1) << v << " " << i;
      }
    }

    if (v >= 7) {
      const uint32_t vword = VersionBits(v);
      for (const VersionPositions &copy : VersionInfoPositions(v)) {
        for (int i = 0; i < 18; i++) {
          const auto [x, y] = copy[i];
          CHECK_EQ(grid.Get(x, y), ((vword >> i) & 1) == 1);
        }
      }
    }

    // Nothing else changed, and the dark module is still dark.
    int changed = 0;
    for (int idx = 0; idx < (int)grid.cells.size(); idx++) {
      if (grid.cells[idx] != layout.modules.cells[idx]) {
        changed++;
        CHECK(layout.kinds[idx] == CellKind::RESERVED);
      }
    }
    CHECK(changed > 0);
    const auto [dx, dy] = DarkModulePosition(v);
    CHECK(grid.Get(dx, dy));
  }

  // Below version 7 there is no version information.
  ModuleGrid grid = FunctionLayout::Get(6).modules;
  WriteVersionInfo(6, &grid);
  CHECK(grid == FunctionLayout::Get(6).modules);
}

int main(int argc, char **argv) {
  TestFormatBits();
  TestVersionBits();
  TestWrite();

  printf("OK\n");
  return 0;
}
