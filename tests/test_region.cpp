#include <catch2/catch.hpp>

#include "ColorSpaceConverter.h"
#include "DedupConfig.h"
#include "RegionClassifier.h"

#include <limits>

TEST_CASE("Chroma bands come first, lightness splits inside them", "[Region]") {
  SECTION("band edges") {
    CHECK(RegionClassifier::Classify(50.0, 9.999) == PerceptualRegion::Neutral);
    CHECK(RegionClassifier::Classify(50.0, 10.0) == PerceptualRegion::Pastel);
    CHECK(RegionClassifier::Classify(50.0, 29.999) == PerceptualRegion::Pastel);
    CHECK(RegionClassifier::Classify(50.0, 30.0) == PerceptualRegion::Saturated);
    CHECK(RegionClassifier::Classify(50.0, 59.999) == PerceptualRegion::Saturated);
    CHECK(RegionClassifier::Classify(50.0, 60.0) == PerceptualRegion::VerySaturated);
  }
  SECTION("dark applies only to the two middle bands") {
    CHECK(RegionClassifier::Classify(29.9, 5.0) == PerceptualRegion::Neutral);
    CHECK(RegionClassifier::Classify(29.9, 20.0) == PerceptualRegion::Dark);
    CHECK(RegionClassifier::Classify(29.9, 45.0) == PerceptualRegion::Dark);
    CHECK(RegionClassifier::Classify(30.0, 45.0) == PerceptualRegion::Saturated);
    CHECK(RegionClassifier::Classify(10.0, 80.0) == PerceptualRegion::VerySaturated);
  }
  SECTION("real colors") {
    CHECK(RegionClassifier::Classify(ColorSpaceConverter::RgbToLab(RgbColor(128, 128, 128))) == PerceptualRegion::Neutral);
    CHECK(RegionClassifier::Classify(ColorSpaceConverter::RgbToLab(RgbColor(200, 150, 150))) == PerceptualRegion::Pastel);
    CHECK(RegionClassifier::Classify(ColorSpaceConverter::RgbToLab(RgbColor(60, 20, 20))) == PerceptualRegion::Dark);
    CHECK(RegionClassifier::Classify(ColorSpaceConverter::RgbToLab(RgbColor(200, 100, 100))) == PerceptualRegion::Saturated);
    CHECK(RegionClassifier::Classify(ColorSpaceConverter::RgbToLab(RgbColor(255, 0, 0))) == PerceptualRegion::VerySaturated);
  }
}

TEST_CASE("Region names parse back", "[Region]") {
  for (int i = 0; i < kPerceptualRegionCount; ++i) {
    const PerceptualRegion region = static_cast<PerceptualRegion>(i);
    PerceptualRegion parsed = PerceptualRegion::Neutral;
    REQUIRE(RegionClassifier::Parse(RegionClassifier::Name(region), parsed));
    CHECK(parsed == region);
  }
  PerceptualRegion unused;
  CHECK_FALSE(RegionClassifier::Parse("vivid", unused));
}

TEST_CASE("Default thresholds grow from neutral to very saturated", "[Region]") {
  const ThresholdTable table;
  CHECK(table.For(PerceptualRegion::Neutral) == 0.5);
  CHECK(table.For(PerceptualRegion::Pastel) == 0.7);
  CHECK(table.For(PerceptualRegion::Dark) == 0.8);
  CHECK(table.For(PerceptualRegion::Saturated) == 1.2);
  CHECK(table.For(PerceptualRegion::VerySaturated) == 1.5);
  for (int i = 1; i < kPerceptualRegionCount; ++i) {
    CHECK(table.values[i] > table.values[i - 1]);
  }
  CHECK(table.Min() == 0.5);

  std::string err;
  CHECK(table.Validate(err));
  CHECK(err.empty());
  CHECK(DedupConfig().CellSize() == Approx(1.0));
}

TEST_CASE("Threshold table validation", "[Region]") {
  ThresholdTable table;
  std::string err;

  SECTION("decrease along the sensitivity order") {
    table.Set(PerceptualRegion::Dark, 0.6);
    CHECK_FALSE(table.Validate(err));
    CHECK(err.find("dark") != std::string::npos);
  }
  SECTION("equal neighbors are accepted") {
    table.Set(PerceptualRegion::Pastel, 0.5);
    CHECK(table.Validate(err));
  }
  SECTION("non-positive or non-finite") {
    table.Set(PerceptualRegion::Neutral, 0.0);
    CHECK_FALSE(table.Validate(err));
    table.Set(PerceptualRegion::Neutral, std::numeric_limits<double>::quiet_NaN());
    CHECK_FALSE(table.Validate(err));
  }
  SECTION("cell size follows the tightest threshold") {
    DedupConfig config;
    config.thresholds.Set(PerceptualRegion::Neutral, 0.25);
    CHECK(config.CellSize() == Approx(0.5));
  }
}
