
#include "placement.h"

#include <cstdint>
#include <cstdio>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "function-layout.h"
#include "tables.h"
#include "types.h"

using namespace fastqr;

static void TestOrder() {
  for (int v = MIN_VERSION; v <= MAX_VERSION; v++) {
    const FunctionLayout &layout = FunctionLayout::Get(v);
    const std::vector<int> order = DataCellOrder(layout);
    CHECK_EQ((int)order.size(), NumRawDataModules(v));
    // Each data cell exactly once.
    std::vector<int> seen(layout.size * layout.size, 0);
    for (int idx : order) {
      CHECK(layout.kinds[idx] == CellKind::DATA) << v << " " << idx;
      seen[idx]++;
    }
    for (int idx = 0; idx < (int)seen.size(); idx++) {
      CHECK_EQ(seen[idx], layout.kinds[idx] == CellKind::DATA ? 1 : 0);
    }
  }
}

static void TestZigzag() {
  const FunctionLayout &layout = FunctionLayout::Get(1);
  const int size = layout.size;
  const std::vector<int> order = DataCellOrder(layout);
  auto At = [&](int i) { return std::make_pair(order[i] % size,
                                               order[i] / size); };
  // Up the rightmost strip, right column first.
  CHECK(At(0) == std::make_pair(20, 20));
  CHECK(At(1) == std::make_pair(19, 20));
  CHECK(At(2) == std::make_pair(20, 19));
  CHECK(At(3) == std::make_pair(19, 19));
  // Stops below the format cells on row 8; 12 rows of the strip.
  CHECK(At(23) == std::make_pair(19, 9));
  // Then down the next strip.
  CHECK(At(24) == std::make_pair(18, 9));
  CHECK(At(25) == std::make_pair(17, 9));
  // The last cells are at the bottom of the leftmost strip. In version
  // 1 this strip is only beside the bottom-left finder's rows 9-12.
  CHECK(At((int)order.size() - 1) == std::make_pair(0, 12));
}

static void TestPlace() {
  for (int v : {1, 2, 7, 21, 40}) {
    const FunctionLayout &layout = FunctionLayout::Get(v);
    const std::vector<uint8_t> codewords(NumTotalCodewords(v), 0xFF);
    ModuleGrid grid = PlaceCodewords(layout, codewords);
    const std::vector<int> order = DataCellOrder(layout);
    const int bits = NumTotalCodewords(v) * 8;
    for (int i = 0; i < (int)order.size(); i++) {
      // Remainder bits are light.
      CHECK_EQ(grid.cells[order[i]], i < bits ? 1 : 0) << v << " " << i;
    }
    // Everything else is unchanged.
    for (int idx = 0; idx < (int)grid.cells.size(); idx++) {
      if (layout.kinds[idx] != CellKind::DATA)
        CHECK_EQ(grid.cells[idx], layout.modules.cells[idx]);
    }
  }

  // MSB first.
  const FunctionLayout &layout = FunctionLayout::Get(1);
  std::vector<uint8_t> codewords(26, 0);
  codewords[0] = 0x80;
  codewords[1] = 0x01;
  ModuleGrid grid = PlaceCodewords(layout, codewords);
  const std::vector<int> order = DataCellOrder(layout);
  for (int i = 0; i < (int)order.size(); i++) {
    CHECK_EQ(grid.cells[order[i]], (i == 0 || i == 15) ? 1 : 0) << i;
  }
}

int main(int argc, char **argv) {
  TestOrder();
  TestZigzag();
  TestPlace();

  printf("OK\n");
  return 0;
}
