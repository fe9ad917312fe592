
#include "placement.h"

#include <cstdint>
#include <span>
#include <vector>

#include "base/logging.h"
#include "function-layout.h"
#include "tables.h"

namespace fastqr {

std::vector<int> DataCellOrder(const FunctionLayout &layout) {
  const int size = layout.size;
  std::vector<int> order;
  order.reserve(NumRawDataModules(layout.version));

  bool upward = true;
  for (int right = size - 1; right >= 1; right -= 2) {
    // The vertical timing pattern takes a whole column, so strips
    // left of it shift over by one.
    if (right == 6) right = 5;
    for (int i = 0; i < size; i++) {
      const int y = upward ? size - 1 - i : i;
      for (int x = right; x >= right - 1; x--) {
        if (layout.IsData(x, y)) order.push_back(y * size + x);
      }
    }
    upward = !upward;
  }
  return order;
}

ModuleGrid PlaceCodewords(const FunctionLayout &layout,
                          std::span<const uint8_t> codewords) {
  CHECK((int)codewords.size() == NumTotalCodewords(layout.version))
    << codewords.size() << " codewords for version " << layout.version;

  ModuleGrid grid = layout.modules;
  const std::vector<int> order = DataCellOrder(layout);
  const size_t num_bits = codewords.size() * 8;
  CHECK(order.size() >= num_bits);
  CHECK(order.size() - num_bits == (size_t)NumRemainderBits(layout.version));

  for (size_t i = 0; i < num_bits; i++) {
    grid.cells[order[i]] = (codewords[i >> 3] >> (7 - (i & 7))) & 1;
  }
  for (size_t i = num_bits; i < order.size(); i++) {
    grid.cells[order[i]] = 0;
  }
  return grid;
}

}  // namespace fastqr
