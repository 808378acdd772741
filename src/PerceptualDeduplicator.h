#pragma once

#include "ColorTypes.h"
#include "DedupConfig.h"
#include "LabGrid.h"
#include "RegionClassifier.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// KeepSet: per-color keep flag plus processed flag.
// - Keep flags start true and only ever flip to false.
// - The processed flag only stops a color from taking a second turn. A processed survivor is still
//   a drop candidate for every color processed after it.
class KeepSet {
public:
  explicit KeepSet(size_t count);

  size_t Size() const { return keep_.size(); }
  size_t KeptCount() const { return kept_; }

  bool IsKept(size_t index) const { return keep_[index] != 0; }
  bool IsProcessed(size_t index) const { return processed_[index] != 0; }

  // Still due a turn: kept and not yet processed.
  bool IsOpen(size_t index) const { return keep_[index] != 0 && processed_[index] == 0; }

  void Drop(size_t index);
  void MarkProcessed(size_t index) { processed_[index] = 1; }

  const ColorMask& Mask() const { return keep_; }

private:
  ColorMask keep_;
  ColorMask processed_;
  size_t kept_;
};

struct DedupStats {
  size_t input = 0;
  size_t kept = 0;
  size_t removed = 0;
  size_t occupiedCells = 0;
  std::array<size_t, kPerceptualRegionCount> regionCounts{};
  std::array<size_t, kPerceptualRegionCount> regionRemoved{};
};

struct DedupResult {
  RgbList colors;  // survivors, ascending original index
  LabList labs;    // Lab of each survivor, same order
  ColorMask keep;  // one flag per input color
  DedupStats stats;
};

// PerceptualDeduplicator: removes colors a viewer could not tell apart.
// Two-phase neighbor search: LabGrid gathers the 5x5x5 cell neighborhood, CIEDE2000 decides.
// Policy:
//   1) Visit colors by descending L (ties: lower input index first).
//   2) Skip colors already dropped.
//   3) The visited color keeps itself and drops every still-kept neighbor closer than
//      the threshold of its own region, whether or not that neighbor already had its turn.
// Deterministic for a given input order. The engine itself is immutable; all run state
// lives in the KeepSet handed to Step.
class PerceptualDeduplicator {
public:
  // Everything Step needs that is fixed for one input set.
  struct Plan {
    LabList labs;
    std::vector<PerceptualRegion> regions;
    std::vector<uint32_t> order;
    LabGrid grid;

    explicit Plan(double cellSize) : grid(cellSize) {}
  };

  // Throws std::invalid_argument if config.Validate fails.
  explicit PerceptualDeduplicator(const DedupConfig& config = DedupConfig());

  const DedupConfig& Config() const { return config_; }

  Plan Prepare(const LabList& labs) const;

  // Processes one color: (KeepSet, index) -> KeepSet'. Returns how many neighbors it dropped.
  // A color that is already dropped or already processed is left untouched (returns 0).
  size_t Step(const Plan& plan, KeepSet& keep, uint32_t index) const;

  DedupResult Run(const RgbList& colors) const;
  DedupResult Run(const RgbList& colors, const LabList& labs) const;

  // Descending L, stable on input index.
  static std::vector<uint32_t> ProcessingOrder(const LabList& labs);

private:
  DedupConfig config_;
};
