
#include "function-layout.h"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "tables.h"
#include "types.h"

namespace fastqr {

std::array<FormatPositions, 2> FormatInfoPositions(int version) {
  const int size = SideLength(version);
  std::array<FormatPositions, 2> pos;

  // First copy: down column 8 (skipping the timing row), then left
  // along row 8 (skipping the timing column).
  for (int i = 0; i <= 5; i++) pos[0][i] = {8, i};
  pos[0][6] = {8, 7};
  pos[0][7] = {8, 8};
  pos[0][8] = {7, 8};
  for (int i = 9; i < 15; i++) pos[0][i] = {14 - i, 8};

  // Second copy: bits 0-7 right to left along row 8 under the
  // top-right finder, bits 8-14 down column 8 beside the bottom-left.
  for (int i = 0; i < 8; i++) pos[1][i] = {size - 1 - i, 8};
  for (int i = 8; i < 15; i++) pos[1][i] = {8, size - 15 + i};
  return pos;
}

std::array<VersionPositions, 2> VersionInfoPositions(int version) {
  const int size = SideLength(version);
  std::array<VersionPositions, 2> pos;
  for (int i = 0; i < 18; i++) {
    // 6x3 block left of the top-right finder, and its transpose
    // above the bottom-left finder.
    const int a = size - 11 + i % 3;
    const int b = i / 3;
    pos[0][i] = {a, b};
    pos[1][i] = {b, a};
  }
  return pos;
}

void FunctionLayout::SetFunction(int x, int y, bool dark) {
  modules.Set(x, y, dark);
  kinds[y * size + x] = CellKind::FUNCTION;
}

void FunctionLayout::Reserve(int x, int y) {
  modules.Set(x, y, false);
  kinds[y * size + x] = CellKind::RESERVED;
}

void FunctionLayout::DrawFinder(int x, int y) {
  // Includes the one-module separator ring.
  for (int dy = -1; dy <= 7; dy++) {
    for (int dx = -1; dx <= 7; dx++) {
      const int xx = x + dx, yy = y + dy;
      if (xx < 0 || xx >= size || yy < 0 || yy >= size) continue;
      // Chebyshev distance from the center.
      const int dist = std::max(std::abs(dx - 3), std::abs(dy - 3));
      SetFunction(xx, yy, dist != 2 && dist <= 3);
    }
  }
}

void FunctionLayout::DrawAlignment(int cx, int cy) {
  for (int dy = -2; dy <= 2; dy++) {
    for (int dx = -2; dx <= 2; dx++) {
      SetFunction(cx + dx, cy + dy,
                  std::max(std::abs(dx), std::abs(dy)) != 1);
    }
  }
}

FunctionLayout FunctionLayout::Build(int version) {
  CHECK(ValidVersion(version)) << version;
  FunctionLayout layout;
  layout.version = version;
  layout.size = SideLength(version);
  const int size = layout.size;
  layout.modules = ModuleGrid(size);
  layout.kinds.resize(size * size, CellKind::DATA);

  // Timing patterns first; the finders overwrite their ends.
  for (int i = 0; i < size; i++) {
    layout.SetFunction(6, i, i % 2 == 0);
    layout.SetFunction(i, 6, i % 2 == 0);
  }

  layout.DrawFinder(0, 0);
  layout.DrawFinder(size - 7, 0);
  layout.DrawFinder(0, size - 7);

  const std::span<const int> centers = AlignmentPatternCenters(version);
  const int n = (int)centers.size();
  for (int i = 0; i < n; i++) {
    for (int j = 0; j < n; j++) {
      // These would overlap the finders.
      if ((i == 0 && j == 0) ||
          (i == 0 && j == n - 1) ||
          (i == n - 1 && j == 0))
        continue;
      layout.DrawAlignment(centers[i], centers[j]);
    }
  }

  for (const FormatPositions &copy : FormatInfoPositions(version))
    for (const auto &[x, y] : copy)
      layout.Reserve(x, y);

  if (version >= 7) {
    for (const VersionPositions &copy : VersionInfoPositions(version))
      for (const auto &[x, y] : copy)
        layout.Reserve(x, y);
  }

  const auto [dx, dy] = DarkModulePosition(version);
  layout.SetFunction(dx, dy, true);

  CHECK(layout.NumDataCells() == NumRawDataModules(version))
    << "Version " << version << ": " << layout.NumDataCells()
    << " data cells";
  return layout;
}

int FunctionLayout::NumDataCells() const {
  int count = 0;
  for (CellKind k : kinds)
    if (k == CellKind::DATA) count++;
  return count;
}

const FunctionLayout &FunctionLayout::Get(int version) {
  CHECK(ValidVersion(version)) << version;
  static std::array<std::once_flag, MAX_VERSION> once;
  static std::array<std::unique_ptr<FunctionLayout>, MAX_VERSION> layouts;
  const int idx = version - 1;
  std::call_once(once[idx], [idx, version]() {
      layouts[idx] = std::make_unique<FunctionLayout>(Build(version));
    });
  return *layouts[idx];
}

}  // namespace fastqr
