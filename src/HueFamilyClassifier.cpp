#include "HueFamilyClassifier.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace {
struct Range {
  float lo;
  float hi;
  bool Contains(float x) const { return x >= lo && x <= hi; }
};

struct FamilyBands {
  const char* name;
  Range hue;
  Range hueWrap; // second hue interval for families straddling 0; empty when lo > hi
  Range sat;
  Range val;
};

const Range kNoRange = {1.0f, 0.0f};

const FamilyBands kBands[kHueFamilyCount] = {
    {"gray",   {0.00f, 1.00f}, kNoRange,       {0.00f, 0.18f}, {0.08f, 0.92f}},
    {"brown",  {0.00f, 0.09f}, kNoRange,       {0.20f, 0.65f}, {0.12f, 0.48f}},
    {"red",    {0.95f, 1.00f}, {0.00f, 0.02f}, {0.22f, 1.00f}, {0.12f, 1.00f}},
    {"orange", {0.02f, 0.12f}, kNoRange,       {0.25f, 1.00f}, {0.48f, 1.00f}},
    {"yellow", {0.12f, 0.18f}, kNoRange,       {0.18f, 1.00f}, {0.20f, 1.00f}},
    {"green",  {0.18f, 0.50f}, kNoRange,       {0.12f, 1.00f}, {0.08f, 1.00f}},
    {"blue",   {0.50f, 0.72f}, kNoRange,       {0.12f, 1.00f}, {0.08f, 1.00f}},
    {"violet", {0.72f, 0.95f}, kNoRange,       {0.12f, 1.00f}, {0.08f, 1.00f}},
};
} // namespace

std::vector<cv::Vec3f> HueFamilyClassifier::RgbToHsv(const RgbList& colors) {
  std::vector<cv::Vec3f> hsv;
  if (colors.empty()) return hsv;

  const cv::Mat rgb(static_cast<int>(colors.size()), 1, CV_8UC3, const_cast<RgbColor*>(colors.data()));
  cv::Mat rgbF;
  rgb.convertTo(rgbF, CV_32FC3, 1.0 / 255.0);

  // Float input: H in [0, 360), S and V in [0, 1].
  cv::Mat hsvMat;
  cv::cvtColor(rgbF, hsvMat, cv::COLOR_RGB2HSV);

  hsv.assign(hsvMat.begin<cv::Vec3f>(), hsvMat.end<cv::Vec3f>());
  for (cv::Vec3f& p : hsv) {
    p[0] /= 360.0f;
    if (p[0] >= 1.0f) p[0] -= 1.0f;
  }
  return hsv;
}

bool HueFamilyClassifier::Contains(HueFamily family, const cv::Vec3f& hsv) {
  const FamilyBands& b = kBands[static_cast<size_t>(family)];
  const bool hueOk = b.hue.Contains(hsv[0]) || b.hueWrap.Contains(hsv[0]);
  return hueOk && b.sat.Contains(hsv[1]) && b.val.Contains(hsv[2]);
}

HueFamilyPartition HueFamilyClassifier::Partition(const RgbList& colors, const std::vector<HueFamily>& families) {
  HueFamilyPartition partition;

  std::array<bool, kHueFamilyCount> requested{};
  for (HueFamily f : families) requested[static_cast<size_t>(f)] = true;

  const std::vector<cv::Vec3f> hsv = RgbToHsv(colors);
  for (size_t i = 0; i < colors.size(); ++i) {
    bool claimed = false;
    for (int f = 0; f < kHueFamilyCount && !claimed; ++f) {
      if (!requested[f] || !Contains(static_cast<HueFamily>(f), hsv[i])) continue;
      FamilyMember m;
      m.color = colors[i];
      m.saturation = hsv[i][1];
      m.value = hsv[i][2];
      m.index = static_cast<uint32_t>(i);
      partition.families[f].push_back(m);
      claimed = true;
    }
    if (!claimed) ++partition.unassigned;
  }

  for (int f = 0; f < kHueFamilyCount; ++f) {
    if (!requested[f]) continue;
    BOOST_LOG_TRIVIAL(info) << "  " << kBands[f].name << ": " << partition.families[f].size() << " colors";
  }
  BOOST_LOG_TRIVIAL(info) << "  unassigned: " << partition.unassigned;
  return partition;
}

std::vector<HueFamily> HueFamilyClassifier::AllFamilies() {
  std::vector<HueFamily> all;
  for (int f = 0; f < kHueFamilyCount; ++f) all.push_back(static_cast<HueFamily>(f));
  return all;
}

const char* HueFamilyClassifier::Name(HueFamily family) {
  const int f = static_cast<int>(family);
  return (f >= 0 && f < kHueFamilyCount) ? kBands[f].name : "unknown";
}

bool HueFamilyClassifier::Parse(const std::string& name, HueFamily& outFamily) {
  const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
  for (int f = 0; f < kHueFamilyCount; ++f) {
    if (key == kBands[f].name) {
      outFamily = static_cast<HueFamily>(f);
      return true;
    }
  }
  return false;
}

bool HueFamilyClassifier::ParseList(const std::string& text, std::vector<HueFamily>& outFamilies, std::string& outError) {
  outError.clear();
  outFamilies.clear();

  const std::string trimmed = boost::algorithm::trim_copy(text);
  if (trimmed.empty() || boost::algorithm::to_lower_copy(trimmed) == "all") {
    outFamilies = AllFamilies();
    return true;
  }

  std::vector<std::string> names;
  boost::algorithm::split(names, trimmed, boost::algorithm::is_any_of(","));
  for (const std::string& name : names) {
    HueFamily family;
    if (!Parse(name, family)) {
      outError = "Unknown hue family '" + boost::algorithm::trim_copy(name) + "'.";
      outFamilies.clear();
      return false;
    }
    if (std::find(outFamilies.begin(), outFamilies.end(), family) == outFamilies.end()) {
      outFamilies.push_back(family);
    }
  }
  return true;
}
