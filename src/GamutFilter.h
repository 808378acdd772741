#pragma once

#include "ColorTypes.h"

#include <cstddef>
#include <memory>
#include <string>

// DeviceTransform: reference RGB -> device -> reference RGB, for a whole batch at once.
// The gamut filter and the print-unique grouping only see this interface.
class DeviceTransform {
public:
  virtual ~DeviceTransform() = default;

  // outColors receives one round-tripped color per input color.
  virtual void RoundTrip(const RgbList& colors, RgbList& outColors) const = 0;
  virtual std::string Describe() const = 0;
};

// IccRoundTripTransform: sRGB <-> printer ICC profile through Little CMS, relative colorimetric intent.
// The device side uses whatever color space the profile declares (RGB, CMYK, ...), 8 bits per channel.
class IccRoundTripTransform : public DeviceTransform {
  struct PrivateTag {};

public:
  // Returns nullptr and fills outError (with the absolute path) if the profile is missing or unusable.
  static std::unique_ptr<IccRoundTripTransform> Open(const std::string& profilePath, std::string& outError);

  // Only Open can build one; it hands over the two lcms transforms it created.
  IccRoundTripTransform(PrivateTag, void* toDevice, void* toReference, int deviceChannels, std::string profilePath);
  ~IccRoundTripTransform() override;
  IccRoundTripTransform(const IccRoundTripTransform&) = delete;
  IccRoundTripTransform& operator=(const IccRoundTripTransform&) = delete;

  void RoundTrip(const RgbList& colors, RgbList& outColors) const override;
  std::string Describe() const override { return profilePath_; }

private:
  void* toDevice_;
  void* toReference_;
  int deviceChannels_;
  std::string profilePath_;
};

struct PrintUniqueStats {
  size_t input = 0;
  size_t uniquePrinted = 0;
  size_t groupsWithDuplicates = 0;
  size_t largestGroup = 0;
};

// GamutFilter: printability checks built on a DeviceTransform.
class GamutFilter {
public:
  struct Params {
    int tolerance = 2;         // max per-channel round-trip deviation still counted as in gamut
    size_t batchSize = 10000;  // colors per RoundTrip call
  };

  static bool ValidateParams(const Params& params, std::string& outError);

  // mask[i] = 1 when max(|rt[i][c] - colors[i][c]|) <= tolerance.
  static ColorMask InGamutMask(const DeviceTransform& device, const RgbList& colors, const Params& params);
  static RgbList KeepInGamut(const DeviceTransform& device, const RgbList& colors, const Params& params);

  // Groups colors by their round-tripped value and keeps, per group, the original closest
  // (squared RGB distance) to the printed value; the earliest index wins ties.
  // Survivors come back in ascending input order.
  static RgbList UniqueByPrintedValue(const DeviceTransform& device,
                                      const RgbList& colors,
                                      const Params& params,
                                      PrintUniqueStats* outStats = nullptr);

private:
  static RgbList RoundTripAll(const DeviceTransform& device, const RgbList& colors, const Params& params);
};
