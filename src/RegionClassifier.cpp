#include "RegionClassifier.h"

#include "ColorSpaceConverter.h"

PerceptualRegion RegionClassifier::Classify(double lightness, double chroma) {
  if (chroma < 10.0) return PerceptualRegion::Neutral;
  if (chroma < 30.0) return lightness < 30.0 ? PerceptualRegion::Dark : PerceptualRegion::Pastel;
  if (chroma < 60.0) return lightness < 30.0 ? PerceptualRegion::Dark : PerceptualRegion::Saturated;
  return PerceptualRegion::VerySaturated;
}

PerceptualRegion RegionClassifier::Classify(const LabColor& lab) {
  return Classify(lab[0], ColorSpaceConverter::Chroma(lab));
}

const char* RegionClassifier::Name(PerceptualRegion region) {
  switch (region) {
    case PerceptualRegion::Neutral: return "neutral";
    case PerceptualRegion::Pastel: return "pastel";
    case PerceptualRegion::Dark: return "dark";
    case PerceptualRegion::Saturated: return "saturated";
    case PerceptualRegion::VerySaturated: return "very_saturated";
  }
  return "unknown";
}

bool RegionClassifier::Parse(const std::string& name, PerceptualRegion& outRegion) {
  for (int i = 0; i < kPerceptualRegionCount; ++i) {
    const PerceptualRegion region = static_cast<PerceptualRegion>(i);
    if (name == Name(region)) {
      outRegion = region;
      return true;
    }
  }
  return false;
}
