#include "LabGrid.h"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace {
const double kOriginL = 0.0;
const double kOriginA = -128.0;
const double kOriginB = -128.0;

inline int CellIndex(double value, double origin, double cellSize) {
  return static_cast<int>(std::floor((value - origin) / cellSize));
}

const std::vector<uint32_t> kEmptyCell;
} // namespace

size_t LabGrid::CellHash::operator()(const GridCell& c) const {
  // Large odd multipliers spread neighboring cells across buckets.
  size_t h = static_cast<size_t>(static_cast<uint32_t>(c.l)) * 73856093u;
  h ^= static_cast<size_t>(static_cast<uint32_t>(c.a)) * 19349663u;
  h ^= static_cast<size_t>(static_cast<uint32_t>(c.b)) * 83492791u;
  return h;
}

LabGrid::LabGrid(double cellSize) : cellSize_(cellSize) {
  if (!std::isfinite(cellSize) || cellSize <= 0.0) {
    throw std::invalid_argument("LabGrid cell size must be a positive number.");
  }
}

GridCell LabGrid::CellOf(const LabColor& lab) const {
  GridCell cell;
  cell.l = CellIndex(lab[0], kOriginL, cellSize_);
  cell.a = CellIndex(lab[1], kOriginA, cellSize_);
  cell.b = CellIndex(lab[2], kOriginB, cellSize_);
  return cell;
}

void LabGrid::Build(const LabList& labs) {
  cells_.clear();
  indexed_ = labs.size();
  for (size_t i = 0; i < labs.size(); ++i) {
    cells_[CellOf(labs[i])].push_back(static_cast<uint32_t>(i));
  }
}

void LabGrid::Gather(const GridCell& center, std::vector<uint32_t>& outIndices) const {
  if (cells_.empty()) return;
  for (int dl = -kSearchRadius; dl <= kSearchRadius; ++dl) {
    for (int da = -kSearchRadius; da <= kSearchRadius; ++da) {
      for (int db = -kSearchRadius; db <= kSearchRadius; ++db) {
        GridCell cell;
        cell.l = center.l + dl;
        cell.a = center.a + da;
        cell.b = center.b + db;
        auto it = cells_.find(cell);
        if (it == cells_.end()) continue;
        outIndices.insert(outIndices.end(), it->second.begin(), it->second.end());
      }
    }
  }
}

const std::vector<uint32_t>& LabGrid::CellMembers(const GridCell& cell) const {
  auto it = cells_.find(cell);
  return it == cells_.end() ? kEmptyCell : it->second;
}

bool LabGrid::WithinSearchRadius(const GridCell& lhs, const GridCell& rhs) {
  return std::abs(lhs.l - rhs.l) <= kSearchRadius &&
         std::abs(lhs.a - rhs.a) <= kSearchRadius &&
         std::abs(lhs.b - rhs.b) <= kSearchRadius;
}
