// The fixed part of a QR symbol of a given version: finder,
// separator, timing and alignment patterns, the dark module, and the
// cells reserved for format and version information. Everything
// else holds codeword bits.

#ifndef FASTQR_FUNCTION_LAYOUT_H_
#define FASTQR_FUNCTION_LAYOUT_H_

#include <array>
#include <cstdint>
#include <utility>
#include <vector>

#include "types.h"

namespace fastqr {

// A square grid of modules, row major. x is the column and y is the
// row, with (0, 0) at the top left. 1 is dark.
struct ModuleGrid {
  ModuleGrid() {}
  explicit ModuleGrid(int size) : size(size), cells(size * size, 0) {}

  int Size() const { return size; }

  bool Get(int x, int y) const { return cells[y * size + x] != 0; }
  void Set(int x, int y, bool dark) { cells[y * size + x] = dark ? 1 : 0; }

  bool operator ==(const ModuleGrid &other) const = default;

  int size = 0;
  std::vector<uint8_t> cells;
};

enum class CellKind : uint8_t {
  // Codeword bits (or remainder bits); the only masked cells.
  DATA = 0,
  // Finder, separator, timing, alignment and the dark module.
  FUNCTION,
  // Format and version information, written after masking.
  RESERVED,
};

// (x, y) positions, one per bit of the information word. Index i
// holds bit i (the least significant bit is index 0).
using FormatPositions = std::array<std::pair<int, int>, 15>;
using VersionPositions = std::array<std::pair<int, int>, 18>;

// The two copies of the format information: around the top-left
// finder, and split between the top-right and bottom-left finders.
std::array<FormatPositions, 2> FormatInfoPositions(int version);
// The two copies of the version information, beside the top-right
// and bottom-left finders. Only meaningful for version >= 7.
std::array<VersionPositions, 2> VersionInfoPositions(int version);

// The always-dark module beside the bottom-left finder.
inline std::pair<int, int> DarkModulePosition(int version) {
  return {8, SideLength(version) - 8};
}

struct FunctionLayout {
  // Layouts are deterministic, so each version's is built once on
  // first use and shared. The version must be valid.
  static const FunctionLayout &Get(int version);

  // Builds a fresh one. Prefer Get().
  static FunctionLayout Build(int version);

  int version = 0;
  int size = 0;
  // Colors of the function modules. Reserved and data cells are light.
  ModuleGrid modules;
  // Parallel to modules.cells.
  std::vector<CellKind> kinds;

  CellKind Kind(int x, int y) const { return kinds[y * size + x]; }
  bool IsData(int x, int y) const { return Kind(x, y) == CellKind::DATA; }

  int NumDataCells() const;

 private:
  void SetFunction(int x, int y, bool dark);
  void Reserve(int x, int y);
  // Finder pattern with its separator; top-left corner of the 7x7
  // pattern at (x, y). Separator modules outside the grid are skipped.
  void DrawFinder(int x, int y);
  // 5x5 pattern centered at (cx, cy).
  void DrawAlignment(int cx, int cy);
};

}  // namespace fastqr

#endif
