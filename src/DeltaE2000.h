#pragma once

#include "ColorTypes.h"

#include <cstdint>
#include <vector>

// CIEDE2000 color difference (kL = kC = kH = 1).
// All hue arithmetic is in degrees. Hue differences are wrapped into (-180, 180].
// Zero-chroma inputs follow the published limiting cases (dh' = 0, mean hue = h1' + h2'),
// so neutral pairs never produce NaN.
class DeltaE2000 {
public:
  static double Distance(const LabColor& lab1, const LabColor& lab2);

  // outDistances[k] = Distance(reference, labs[indices[k]]).
  // Runs the loop through cv::parallel_for_ when parallel is true; read-only on labs.
  static void DistanceToMany(const LabColor& reference,
                             const LabList& labs,
                             const std::vector<uint32_t>& indices,
                             std::vector<double>& outDistances,
                             bool parallel = false);
};
