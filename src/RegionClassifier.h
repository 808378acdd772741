#pragma once

#include "ColorTypes.h"

#include <string>

// Perceptual regions, ordered from most to least sensitive to color differences.
// The numeric order is relied upon by ThresholdTable.
enum class PerceptualRegion {
  Neutral = 0,
  Pastel,
  Dark,
  Saturated,
  VerySaturated
};

constexpr int kPerceptualRegionCount = 5;

// RegionClassifier: maps (L, chroma) to the region whose threshold applies.
// Chroma bands are tested first (first match wins), then L subdivides inside the band:
//   chroma < 10        -> neutral
//   10 <= chroma < 30  -> dark if L < 30, else pastel
//   30 <= chroma < 60  -> dark if L < 30, else saturated
//   chroma >= 60       -> very_saturated
class RegionClassifier {
public:
  static PerceptualRegion Classify(double lightness, double chroma);
  static PerceptualRegion Classify(const LabColor& lab);

  // "neutral", "pastel", "dark", "saturated", "very_saturated"
  static const char* Name(PerceptualRegion region);
  static bool Parse(const std::string& name, PerceptualRegion& outRegion);
};
