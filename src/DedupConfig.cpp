#include "DedupConfig.h"

#include <algorithm>
#include <cmath>
#include <sstream>

double ThresholdTable::Min() const {
  return *std::min_element(values.begin(), values.end());
}

bool ThresholdTable::Validate(std::string& outError) const {
  outError.clear();
  for (int i = 0; i < kPerceptualRegionCount; ++i) {
    const double v = values[i];
    if (!std::isfinite(v) || v <= 0.0) {
      std::ostringstream os;
      os << "Threshold for region '" << RegionClassifier::Name(static_cast<PerceptualRegion>(i))
         << "' must be a positive number (got " << v << ").";
      outError = os.str();
      return false;
    }
    if (i > 0 && v < values[i - 1]) {
      std::ostringstream os;
      os << "Threshold for region '" << RegionClassifier::Name(static_cast<PerceptualRegion>(i))
         << "' (" << v << ") is lower than the threshold for the more sensitive region '"
         << RegionClassifier::Name(static_cast<PerceptualRegion>(i - 1)) << "' (" << values[i - 1] << ").";
      outError = os.str();
      return false;
    }
  }
  return true;
}

bool DedupConfig::Validate(std::string& outError) const {
  if (!thresholds.Validate(outError)) return false;
  if (parallelDistances && parallelMinCandidates == 0) {
    outError = "Parallel candidate minimum must be at least 1.";
    return false;
  }
  return true;
}
