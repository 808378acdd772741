#pragma once

#include "RegionClassifier.h"

#include <array>
#include <cstddef>
#include <string>

// ThresholdTable: region -> CIEDE2000 threshold below which two colors count as duplicates.
// Invariant: thresholds never decrease from neutral (tightest) to very_saturated (loosest).
struct ThresholdTable {
  std::array<double, kPerceptualRegionCount> values{{
      0.5, // neutral
      0.7, // pastel
      0.8, // dark
      1.2, // saturated
      1.5  // very_saturated
  }};

  double For(PerceptualRegion region) const { return values[static_cast<size_t>(region)]; }
  void Set(PerceptualRegion region, double threshold) { values[static_cast<size_t>(region)] = threshold; }
  double Min() const;

  // Rejects non-finite / non-positive entries and any decrease along the sensitivity order.
  bool Validate(std::string& outError) const;
};

// Immutable engine configuration, passed by value into PerceptualDeduplicator.
struct DedupConfig {
  ThresholdTable thresholds;

  // Inner distance loop goes through cv::parallel_for_ once a color has this many candidates.
  bool parallelDistances = true;
  size_t parallelMinCandidates = 4096;

  // Debug-level progress line every N processed colors (0 disables).
  size_t progressInterval = 100000;

  // Grid cell edge in Lab units: twice the tightest threshold.
  double CellSize() const { return 2.0 * thresholds.Min(); }
  bool Validate(std::string& outError) const;
};
