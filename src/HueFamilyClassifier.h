#pragma once

#include "ColorTypes.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Named hue families used to lay colors out in groups. Declaration order is the claim priority.
enum class HueFamily {
  Gray = 0,
  Brown,
  Red,
  Orange,
  Yellow,
  Green,
  Blue,
  Violet
};

constexpr int kHueFamilyCount = 8;

struct FamilyMember {
  RgbColor color;
  float saturation = 0.0f;
  float value = 0.0f;
  uint32_t index = 0; // position in the partitioned list
};

struct HueFamilyPartition {
  std::array<std::vector<FamilyMember>, kHueFamilyCount> families;
  size_t unassigned = 0;

  const std::vector<FamilyMember>& Members(HueFamily family) const { return families[static_cast<size_t>(family)]; }
};

// HueFamilyClassifier: HSV band partition of a color list.
// HSV comes from cv::cvtColor on float input; hue is rescaled to [0, 1), saturation and value are in [0, 1].
// Every band bound is inclusive. A color goes to the first requested family (in priority order) whose
// bands contain it; colors no requested family claims are counted as unassigned.
class HueFamilyClassifier {
public:
  // One (h, s, v) per color.
  static std::vector<cv::Vec3f> RgbToHsv(const RgbList& colors);

  static bool Contains(HueFamily family, const cv::Vec3f& hsv);

  static HueFamilyPartition Partition(const RgbList& colors, const std::vector<HueFamily>& families);

  static std::vector<HueFamily> AllFamilies();
  static const char* Name(HueFamily family);
  static bool Parse(const std::string& name, HueFamily& outFamily);

  // Comma-separated family names, e.g. "red,blue". Empty or "all" selects every family.
  static bool ParseList(const std::string& text, std::vector<HueFamily>& outFamilies, std::string& outError);
};
