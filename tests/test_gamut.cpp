#include <catch2/catch.hpp>

#include "FakeDevices.h"
#include "GamutFilter.h"

#include <boost/filesystem.hpp>
#include <lcms2.h>

#include <memory>
#include <stdexcept>

namespace {
// Returns one color fewer than asked for.
class ShortDevice : public DeviceTransform {
public:
  void RoundTrip(const RgbList& colors, RgbList& outColors) const override {
    outColors.assign(colors.begin(), colors.end());
    if (!outColors.empty()) outColors.pop_back();
  }
  std::string Describe() const override { return "short device"; }
};
} // namespace

TEST_CASE("In-gamut mask uses the max channel deviation", "[Gamut]") {
  const ClampDevice device(20, 235);
  const RgbList colors = {
      RgbColor(100, 100, 100), // inside
      RgbColor(255, 0, 0),     // far outside
      RgbColor(18, 100, 237),  // off by 2 on two channels
      RgbColor(17, 100, 100),  // off by 3
  };
  GamutFilter::Params params;

  CHECK(GamutFilter::InGamutMask(device, colors, params) == ColorMask({1, 0, 1, 0}));

  params.tolerance = 0;
  CHECK(GamutFilter::InGamutMask(device, colors, params) == ColorMask({1, 0, 0, 0}));

  params.tolerance = 255;
  CHECK(GamutFilter::InGamutMask(device, colors, params) == ColorMask({1, 1, 1, 1}));
}

TEST_CASE("KeepInGamut batches and preserves order", "[Gamut]") {
  const ClampDevice device(20, 235);
  RgbList colors;
  for (int i = 0; i < 256; ++i) colors.push_back(RgbColor(static_cast<uchar>(i), 128, 128));

  GamutFilter::Params params;
  params.batchSize = 100;
  const RgbList kept = GamutFilter::KeepInGamut(device, colors, params);

  CHECK(device.calls == 3);
  REQUIRE(kept.size() == 220); // 18 ..= 237
  CHECK(kept.front() == RgbColor(18, 128, 128));
  CHECK(kept.back() == RgbColor(237, 128, 128));
}

TEST_CASE("Empty input never reaches the device", "[Gamut]") {
  const ClampDevice device(0, 255);
  CHECK(GamutFilter::InGamutMask(device, RgbList(), GamutFilter::Params()).empty());
  CHECK(device.calls == 0);
}

TEST_CASE("A device returning the wrong count is an error", "[Gamut]") {
  CHECK_THROWS_AS(GamutFilter::InGamutMask(ShortDevice(), RgbList(3), GamutFilter::Params()), std::runtime_error);
}

TEST_CASE("Print-unique keeps one original per printed value", "[Gamut]") {
  const QuantizeDevice device(4);
  PrintUniqueStats stats;

  SECTION("closest original wins") {
    const RgbList colors = {RgbColor(11, 11, 11), RgbColor(9, 9, 9), RgbColor(8, 8, 8), RgbColor(100, 0, 0)};
    const RgbList kept = GamutFilter::UniqueByPrintedValue(device, colors, GamutFilter::Params(), &stats);
    const RgbList expected = {RgbColor(8, 8, 8), RgbColor(100, 0, 0)};
    CHECK(kept == expected);
    CHECK(stats.input == 4);
    CHECK(stats.uniquePrinted == 2);
    CHECK(stats.groupsWithDuplicates == 1);
    CHECK(stats.largestGroup == 3);
  }
  SECTION("ties go to the earliest color") {
    const RgbList colors = {RgbColor(50, 50, 50), RgbColor(9, 8, 8), RgbColor(8, 9, 8)};
    const RgbList kept = GamutFilter::UniqueByPrintedValue(device, colors, GamutFilter::Params(), &stats);
    const RgbList expected = {RgbColor(50, 50, 50), RgbColor(9, 8, 8)};
    CHECK(kept == expected);
  }
  SECTION("already printable colors all survive") {
    const RgbList colors = {RgbColor(0, 4, 8), RgbColor(4, 4, 4), RgbColor(252, 0, 0)};
    CHECK(GamutFilter::UniqueByPrintedValue(device, colors, GamutFilter::Params()) == colors);
  }
}

TEST_CASE("Gamut parameter validation", "[Gamut]") {
  GamutFilter::Params params;
  std::string err;
  CHECK(GamutFilter::ValidateParams(params, err));

  params.tolerance = -1;
  CHECK_FALSE(GamutFilter::ValidateParams(params, err));

  params.tolerance = 2;
  params.batchSize = 0;
  CHECK_FALSE(GamutFilter::ValidateParams(params, err));
  CHECK_FALSE(err.empty());
}

TEST_CASE("Opening a missing ICC profile reports the absolute path", "[Gamut]") {
  const boost::filesystem::path missing = boost::filesystem::temp_directory_path() /
                                          boost::filesystem::unique_path("no-such-profile-%%%%%%.icc");
  std::string err;
  CHECK(IccRoundTripTransform::Open(missing.string(), err) == nullptr);
  CHECK(err.find(boost::filesystem::absolute(missing).string()) != std::string::npos);
}

TEST_CASE("An sRGB profile opens and round-trips within tolerance", "[Gamut]") {
  namespace fs = boost::filesystem;
  const fs::path dir = fs::temp_directory_path() / fs::unique_path("colorsieve-icc-%%%%-%%%%");
  fs::create_directories(dir);
  const fs::path profile = dir / "srgb.icc";

  cmsHPROFILE srgb = cmsCreate_sRGBProfile();
  REQUIRE(srgb != nullptr);
  const cmsBool saved = cmsSaveProfileToFile(srgb, profile.string().c_str());
  cmsCloseProfile(srgb);
  REQUIRE(saved);

  std::string err;
  std::unique_ptr<IccRoundTripTransform> device = IccRoundTripTransform::Open(profile.string(), err);
  REQUIRE(device != nullptr);
  CHECK(err.empty());
  CHECK(device->Describe().find(fs::absolute(profile).string()) != std::string::npos);

  const RgbList colors = {RgbColor(0, 0, 0), RgbColor(255, 255, 255), RgbColor(200, 30, 90), RgbColor(12, 160, 240)};
  RgbList printed;
  device->RoundTrip(colors, printed);
  REQUIRE(printed.size() == colors.size());
  CHECK(GamutFilter::InGamutMask(*device, colors, GamutFilter::Params()) == ColorMask({1, 1, 1, 1}));

  device.reset();
  boost::system::error_code ec;
  fs::remove_all(dir, ec);
}
