#pragma once

#include "ColorTypes.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

// Integer cell coordinate in the Lab grid.
struct GridCell {
  int l = 0;
  int a = 0;
  int b = 0;

  bool operator==(const GridCell& other) const { return l == other.l && a == other.a && b == other.b; }
};

// LabGrid: uniform 3D bucket grid over Lab space, origin (L=0, a=-128, b=-128).
// - Coarse phase of the neighbor search; callers run the exact distance on what Gather returns.
// - Membership is fixed at Build time. Indices stay in their cells even after the caller
//   drops those colors, so Gather results must be filtered against the caller's own state.
class LabGrid {
public:
  // Chebyshev radius of a query, in cells (5 x 5 x 5 neighborhood).
  static constexpr int kSearchRadius = 2;

  explicit LabGrid(double cellSize);

  void Build(const LabList& labs);

  GridCell CellOf(const LabColor& lab) const;

  // Appends every index stored within kSearchRadius cells of center (center included) to outIndices.
  void Gather(const GridCell& center, std::vector<uint32_t>& outIndices) const;

  // Indices stored in exactly this cell (empty if unoccupied).
  const std::vector<uint32_t>& CellMembers(const GridCell& cell) const;

  double CellSize() const { return cellSize_; }
  size_t OccupiedCells() const { return cells_.size(); }
  size_t IndexedColors() const { return indexed_; }

  // True when two cells are within one query of each other.
  static bool WithinSearchRadius(const GridCell& lhs, const GridCell& rhs);

private:
  struct CellHash {
    size_t operator()(const GridCell& c) const;
  };

  double cellSize_;
  size_t indexed_ = 0;
  std::unordered_map<GridCell, std::vector<uint32_t>, CellHash> cells_;
};
