// Data masking and mask selection. Each of the eight mask patterns
// is applied to the data cells, the format and version information
// are written, and the candidate with the lowest penalty score is
// kept.

#ifndef FASTQR_MASK_H_
#define FASTQR_MASK_H_

#include <array>
#include <cstdint>

#include "function-layout.h"
#include "types.h"

namespace fastqr {

static constexpr int NUM_MASKS = 8;

// Penalty weights for the four scoring rules.
static constexpr int PENALTY_N1 = 3;
static constexpr int PENALTY_N2 = 3;
static constexpr int PENALTY_N3 = 40;
static constexpr int PENALTY_N4 = 10;

// True if the mask pattern inverts the module at column x, row y.
bool MaskInverts(int mask, int x, int y);

// XORs the mask pattern into the data cells of the grid. Function and
// reserved cells are untouched. Applying the same mask twice is the
// identity.
void ApplyMask(const FunctionLayout &layout, int mask, ModuleGrid *grid);

// A copy of the placed (unmasked) grid with the mask applied and the
// format and version information written. This is a complete symbol.
ModuleGrid MaskedCandidate(const FunctionLayout &layout,
                           const ModuleGrid &placed,
                           ECL ecl, int mask);

struct PenaltyBreakdown {
  // Rule 1: runs of five or more same-colored modules in a row or
  // column.
  int64_t runs = 0;
  // Rule 2: 2x2 blocks of one color.
  int64_t blocks = 0;
  // Rule 3: 1:1:3:1:1 finder-like patterns with four light modules
  // on one side.
  int64_t finder = 0;
  // Rule 4: deviation of the dark proportion from 50%.
  int64_t balance = 0;

  int64_t Total() const { return runs + blocks + finder + balance; }
};

PenaltyBreakdown ScorePenalty(const ModuleGrid &grid);

struct MaskChoice {
  int mask = 0;
  int64_t penalty = 0;
  // Total penalty of every candidate, indexed by mask.
  std::array<int64_t, NUM_MASKS> penalties = {};
};

// The mask with the lowest penalty; the lowest index among equals.
int LowestPenaltyMask(const std::array<int64_t, NUM_MASKS> &penalties);

// Scores all eight candidates and returns the one with the lowest
// total penalty; ties go to the lowest mask number. Candidates are
// scored on up to max_concurrency threads. The result does not depend
// on the thread count.
MaskChoice ChooseMask(const FunctionLayout &layout,
                      const ModuleGrid &placed,
                      ECL ecl,
                      int max_concurrency = 1);

}  // namespace fastqr

#endif
