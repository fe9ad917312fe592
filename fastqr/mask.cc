
#include "mask.h"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <vector>

#include "base/logging.h"
#include "format-info.h"
#include "function-layout.h"
#include "threadutil.h"
#include "types.h"

namespace fastqr {

bool MaskInverts(int mask, int x, int y) {
  switch (mask) {
  case 0: return (x + y) % 2 == 0;
  case 1: return y % 2 == 0;
  case 2: return x % 3 == 0;
  case 3: return (x + y) % 3 == 0;
  case 4: return (x / 3 + y / 2) % 2 == 0;
  case 5: return x * y % 2 + x * y % 3 == 0;
  case 6: return (x * y % 2 + x * y % 3) % 2 == 0;
  case 7: return ((x + y) % 2 + x * y % 3) % 2 == 0;
  default:
    LOG(FATAL) << "Bad mask " << mask;
  }
}

void ApplyMask(const FunctionLayout &layout, int mask, ModuleGrid *grid) {
  CHECK(mask >= 0 && mask < NUM_MASKS) << mask;
  CHECK(grid->Size() == layout.size);
  for (int y = 0; y < layout.size; y++) {
    for (int x = 0; x < layout.size; x++) {
      if (layout.IsData(x, y) && MaskInverts(mask, x, y)) {
        grid->Set(x, y, !grid->Get(x, y));
      }
    }
  }
}

ModuleGrid MaskedCandidate(const FunctionLayout &layout,
                           const ModuleGrid &placed,
                           ECL ecl, int mask) {
  ModuleGrid grid = placed;
  ApplyMask(layout, mask, &grid);
  WriteFormatInfo(ecl, mask, layout.version, &grid);
  WriteVersionInfo(layout.version, &grid);
  return grid;
}

namespace {
// Scores rules 1 and 3 along one row or column: count cells starting
// at cells[start], stepping by stride.
struct LineScanner {
  explicit LineScanner(const ModuleGrid &grid) : grid(grid) {}

  void Scan(int start, int stride, int count) {
    const uint8_t *cells = grid.cells.data();

    // Run lengths, alternating colors. The line is treated as
    // bordered on both sides by 'count' light modules, so runs[0] and
    // the last run are always light.
    runs.clear();
    uint8_t color = 0;
    int len = count;
    for (int i = 0; i < count; i++) {
      const uint8_t c = cells[start + i * stride];
      if (c == color) {
        len++;
      } else {
        runs.push_back(len);
        color = c;
        len = 1;
      }
    }
    if (color != 0) {
      runs.push_back(len);
      len = 0;
    }
    runs.push_back(len + count);

    // Rule 1. The border runs are not part of the symbol.
    const int last = (int)runs.size() - 1;
    for (int i = 0; i <= last; i++) {
      int run = runs[i];
      if (i == 0) run -= count;
      if (i == last) run -= count;
      if (run >= 5) run_penalty += PENALTY_N1 + (run - 5);
    }

    // Rule 3. Light runs are at even indices. Check each window of
    // seven runs that starts and ends light.
    for (int k = 6; k < (int)runs.size(); k += 2) {
      const int before = runs[k - 6];
      const int n = runs[k - 5];
      const int after = runs[k];
      if (n > 0 &&
          runs[k - 4] == n &&
          runs[k - 3] == n * 3 &&
          runs[k - 2] == n &&
          runs[k - 1] == n) {
        if (before >= n * 4 && after >= n) finder_count++;
        if (after >= n * 4 && before >= n) finder_count++;
      }
    }
  }

  const ModuleGrid &grid;
  std::vector<int> runs;
  int64_t run_penalty = 0;
  int64_t finder_count = 0;
};
}  // namespace

PenaltyBreakdown ScorePenalty(const ModuleGrid &grid) {
  const int size = grid.Size();
  CHECK(size > 0);
  PenaltyBreakdown penalty;

  LineScanner scanner(grid);
  for (int y = 0; y < size; y++) scanner.Scan(y * size, 1, size);
  for (int x = 0; x < size; x++) scanner.Scan(x, size, size);
  penalty.runs = scanner.run_penalty;
  penalty.finder = scanner.finder_count * PENALTY_N3;

  int64_t blocks = 0;
  for (int y = 0; y + 1 < size; y++) {
    for (int x = 0; x + 1 < size; x++) {
      const bool c = grid.Get(x, y);
      if (c == grid.Get(x + 1, y) &&
          c == grid.Get(x, y + 1) &&
          c == grid.Get(x + 1, y + 1))
        blocks++;
    }
  }
  penalty.blocks = blocks * PENALTY_N2;

  int64_t dark = 0;
  for (uint8_t c : grid.cells) dark += c;
  const int64_t total = (int64_t)size * size;
  // Smallest k such that the dark proportion is within (5 + 5k)% of
  // 50%.
  const int64_t k = (std::abs(dark * 20 - total * 10) + total - 1) / total - 1;
  CHECK(k >= 0 && k <= 9) << k;
  penalty.balance = k * PENALTY_N4;

  return penalty;
}

int LowestPenaltyMask(const std::array<int64_t, NUM_MASKS> &penalties) {
  int best = 0;
  for (int mask = 1; mask < NUM_MASKS; mask++) {
    // Strict, so earlier masks win ties.
    if (penalties[mask] < penalties[best]) best = mask;
  }
  return best;
}

MaskChoice ChooseMask(const FunctionLayout &layout,
                      const ModuleGrid &placed,
                      ECL ecl,
                      int max_concurrency) {
  std::vector<int64_t> scores =
    ParallelTabulate(NUM_MASKS,
                     [&](int64_t mask) -> int64_t {
                       ModuleGrid candidate =
                         MaskedCandidate(layout, placed, ecl, (int)mask);
                       return ScorePenalty(candidate).Total();
                     },
                     max_concurrency);

  CHECK((int)scores.size() == NUM_MASKS);
  MaskChoice choice;
  for (int mask = 0; mask < NUM_MASKS; mask++)
    choice.penalties[mask] = scores[mask];
  choice.mask = LowestPenaltyMask(choice.penalties);
  choice.penalty = choice.penalties[choice.mask];
  return choice;
}

}  // namespace fastqr
