#include "GamutFilter.h"

#include "ColorSetOps.h"

#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>
#include <lcms2.h>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {
// Closes an lcms profile handle on scope exit.
struct ProfileHandle {
  cmsHPROFILE handle = nullptr;
  explicit ProfileHandle(cmsHPROFILE h) : handle(h) {}
  ~ProfileHandle() {
    if (handle) cmsCloseProfile(handle);
  }
  ProfileHandle(const ProfileHandle&) = delete;
  ProfileHandle& operator=(const ProfileHandle&) = delete;
};

int SquaredDistance(const RgbColor& a, const RgbColor& b) {
  int sum = 0;
  for (int c = 0; c < 3; ++c) {
    const int d = static_cast<int>(a[c]) - static_cast<int>(b[c]);
    sum += d * d;
  }
  return sum;
}
} // namespace

IccRoundTripTransform::IccRoundTripTransform(PrivateTag, void* toDevice, void* toReference, int deviceChannels,
                                             std::string profilePath)
    : toDevice_(toDevice), toReference_(toReference), deviceChannels_(deviceChannels), profilePath_(std::move(profilePath)) {}

IccRoundTripTransform::~IccRoundTripTransform() {
  if (toDevice_) cmsDeleteTransform(static_cast<cmsHTRANSFORM>(toDevice_));
  if (toReference_) cmsDeleteTransform(static_cast<cmsHTRANSFORM>(toReference_));
}

std::unique_ptr<IccRoundTripTransform> IccRoundTripTransform::Open(const std::string& profilePath, std::string& outError) {
  outError.clear();
  const std::string resolved = boost::filesystem::absolute(profilePath).string();

  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(resolved, ec)) {
    outError = "ICC profile not found: " + resolved;
    return nullptr;
  }

  ProfileHandle device(cmsOpenProfileFromFile(resolved.c_str(), "r"));
  if (!device.handle) {
    outError = "Not a readable ICC profile: " + resolved;
    return nullptr;
  }
  ProfileHandle reference(cmsCreate_sRGBProfile());
  if (!reference.handle) {
    outError = "Little CMS could not create the sRGB reference profile.";
    return nullptr;
  }

  const cmsUInt32Number deviceFormat = cmsFormatterForColorspaceOfProfile(device.handle, 1, FALSE);
  const int deviceChannels = static_cast<int>(cmsChannelsOf(cmsGetColorSpace(device.handle)));
  if (deviceFormat == 0 || deviceChannels <= 0) {
    outError = "Unsupported device color space in ICC profile: " + resolved;
    return nullptr;
  }

  cmsHTRANSFORM toDevice = cmsCreateTransform(reference.handle, TYPE_RGB_8, device.handle, deviceFormat,
                                              INTENT_RELATIVE_COLORIMETRIC, 0);
  if (!toDevice) {
    outError = "Cannot build sRGB -> device transform from " + resolved;
    return nullptr;
  }
  cmsHTRANSFORM toReference = cmsCreateTransform(device.handle, deviceFormat, reference.handle, TYPE_RGB_8,
                                                 INTENT_RELATIVE_COLORIMETRIC, 0);
  if (!toReference) {
    cmsDeleteTransform(toDevice);
    outError = "Cannot build device -> sRGB transform from " + resolved;
    return nullptr;
  }

  BOOST_LOG_TRIVIAL(info) << "ICC profile " << resolved << " (" << deviceChannels << " device channels)";
  return std::make_unique<IccRoundTripTransform>(PrivateTag(), toDevice, toReference, deviceChannels, resolved);
}

void IccRoundTripTransform::RoundTrip(const RgbList& colors, RgbList& outColors) const {
  outColors.resize(colors.size());
  if (colors.empty()) return;

  // cv::Vec3b is three packed bytes, so the lists are TYPE_RGB_8 buffers as they are.
  static_assert(sizeof(RgbColor) == 3, "RgbColor must be tightly packed");
  std::vector<uint8_t> deviceBuffer(colors.size() * static_cast<size_t>(deviceChannels_));
  const cmsUInt32Number count = static_cast<cmsUInt32Number>(colors.size());
  cmsDoTransform(static_cast<cmsHTRANSFORM>(toDevice_), colors.data(), deviceBuffer.data(), count);
  cmsDoTransform(static_cast<cmsHTRANSFORM>(toReference_), deviceBuffer.data(), outColors.data(), count);
}

bool GamutFilter::ValidateParams(const Params& params, std::string& outError) {
  outError.clear();
  if (params.tolerance < 0 || params.tolerance > 255) {
    outError = "Gamut tolerance must be within [0, 255].";
    return false;
  }
  if (params.batchSize == 0) {
    outError = "Gamut batch size must be at least 1.";
    return false;
  }
  return true;
}

RgbList GamutFilter::RoundTripAll(const DeviceTransform& device, const RgbList& colors, const Params& params) {
  const size_t batchSize = std::max<size_t>(1, params.batchSize);
  const size_t reportEvery = batchSize * 10;

  RgbList printed(colors.size());
  RgbList batch;
  RgbList batchOut;
  for (size_t start = 0; start < colors.size(); start += batchSize) {
    const size_t end = std::min(colors.size(), start + batchSize);
    batch.assign(colors.begin() + start, colors.begin() + end);
    device.RoundTrip(batch, batchOut);
    if (batchOut.size() != batch.size()) {
      throw std::runtime_error("Device transform " + device.Describe() + " returned " +
                               std::to_string(batchOut.size()) + " colors for a batch of " +
                               std::to_string(batch.size()));
    }
    std::copy(batchOut.begin(), batchOut.begin() + batch.size(), printed.begin() + start);

    if (end % reportEvery == 0 || end == colors.size()) {
      BOOST_LOG_TRIVIAL(debug) << "  round trip " << end << "/" << colors.size() << " (" << std::fixed
                               << std::setprecision(1) << 100.0 * end / colors.size() << "%)";
    }
  }
  return printed;
}

ColorMask GamutFilter::InGamutMask(const DeviceTransform& device, const RgbList& colors, const Params& params) {
  ColorMask mask(colors.size(), 0);
  if (colors.empty()) return mask;

  const RgbList printed = RoundTripAll(device, colors, params);
  size_t inGamut = 0;
  for (size_t i = 0; i < colors.size(); ++i) {
    int maxDiff = 0;
    for (int c = 0; c < 3; ++c) {
      maxDiff = std::max(maxDiff, std::abs(static_cast<int>(printed[i][c]) - static_cast<int>(colors[i][c])));
    }
    if (maxDiff <= params.tolerance) {
      mask[i] = 1;
      ++inGamut;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Gamut check against " << device.Describe() << ": " << inGamut << "/" << colors.size()
                          << " in gamut (" << std::fixed << std::setprecision(1)
                          << 100.0 * inGamut / colors.size() << "%), tolerance " << params.tolerance;
  return mask;
}

RgbList GamutFilter::KeepInGamut(const DeviceTransform& device, const RgbList& colors, const Params& params) {
  return ColorSetOps::SelectByMask(colors, InGamutMask(device, colors, params));
}

RgbList GamutFilter::UniqueByPrintedValue(const DeviceTransform& device,
                                          const RgbList& colors,
                                          const Params& params,
                                          PrintUniqueStats* outStats) {
  PrintUniqueStats stats;
  stats.input = colors.size();

  struct Group {
    size_t best = 0;
    int bestDistance = std::numeric_limits<int>::max();
    size_t size = 0;
  };

  const RgbList printed = RoundTripAll(device, colors, params);
  std::unordered_map<uint32_t, Group> groups;
  for (size_t i = 0; i < colors.size(); ++i) {
    Group& g = groups[ColorSetOps::Pack(printed[i])];
    ++g.size;
    const int d = SquaredDistance(colors[i], printed[i]);
    if (d < g.bestDistance) {
      g.bestDistance = d;
      g.best = i;
    }
  }

  ColorMask keep(colors.size(), 0);
  for (const auto& entry : groups) {
    const Group& g = entry.second;
    keep[g.best] = 1;
    if (g.size > 1) ++stats.groupsWithDuplicates;
    stats.largestGroup = std::max(stats.largestGroup, g.size);
  }
  stats.uniquePrinted = groups.size();

  BOOST_LOG_TRIVIAL(info) << "Print-unique: " << stats.uniquePrinted << " unique printed values from " << stats.input
                          << " colors; " << stats.groupsWithDuplicates << " groups with duplicates, largest group "
                          << stats.largestGroup;
  if (outStats) *outStats = stats;
  return ColorSetOps::SelectByMask(colors, keep);
}
