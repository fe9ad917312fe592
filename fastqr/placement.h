
#ifndef FASTQR_PLACEMENT_H_
#define FASTQR_PLACEMENT_H_

#include <cstdint>
#include <span>
#include <vector>

#include "function-layout.h"

namespace fastqr {

// Indices (y * size + x) of every data cell, in the order codeword
// bits are placed: two-column strips from the right edge, skipping
// the vertical timing column, alternately upward and downward, the
// right column of each strip before the left.
std::vector<int> DataCellOrder(const FunctionLayout &layout);

// Copies the layout's function modules and writes the codewords'
// bits (most significant first) into the data cells in DataCellOrder.
// Data cells beyond the last codeword (remainder bits) are written
// light. The number of codewords must be the version's total.
ModuleGrid PlaceCodewords(const FunctionLayout &layout,
                          std::span<const uint8_t> codewords);

}  // namespace fastqr

#endif
