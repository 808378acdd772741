#include <catch2/catch.hpp>

#include "DeltaE2000.h"

#include <cmath>

namespace {
struct ReferencePair {
  double lab1[3];
  double lab2[3];
  double expected;
};

// Sharma, Wu, Dalal (2005) test data.
const ReferencePair kSharmaPairs[] = {
    {{50.0000, 2.6772, -79.7751}, {50.0000, 0.0000, -82.7485}, 2.0425},
    {{50.0000, 3.1571, -77.2803}, {50.0000, 0.0000, -82.7485}, 2.8615},
    {{50.0000, 2.8361, -74.0200}, {50.0000, 0.0000, -82.7485}, 3.4412},
    {{50.0000, -1.3802, -84.2814}, {50.0000, 0.0000, -82.7485}, 1.0000},
    {{50.0000, -1.1848, -84.8006}, {50.0000, 0.0000, -82.7485}, 1.0000},
    {{50.0000, -0.9009, -85.5211}, {50.0000, 0.0000, -82.7485}, 1.0000},
    {{50.0000, 0.0000, 0.0000}, {50.0000, -1.0000, 2.0000}, 2.3669},
    {{50.0000, -1.0000, 2.0000}, {50.0000, 0.0000, 0.0000}, 2.3669},
    {{50.0000, 2.4900, -0.0010}, {50.0000, -2.4900, 0.0009}, 7.1792},
    {{50.0000, 2.4900, -0.0010}, {50.0000, -2.4900, 0.0010}, 7.1792},
    {{50.0000, 2.4900, -0.0010}, {50.0000, -2.4900, 0.0011}, 7.2195},
    {{50.0000, 2.4900, -0.0010}, {50.0000, -2.4900, 0.0012}, 7.2195},
    {{50.0000, -0.0010, 2.4900}, {50.0000, 0.0009, -2.4900}, 4.8045},
    {{50.0000, -0.0010, 2.4900}, {50.0000, 0.0010, -2.4900}, 4.8045},
    {{50.0000, -0.0010, 2.4900}, {50.0000, 0.0011, -2.4900}, 4.7461},
    {{50.0000, 2.5000, 0.0000}, {50.0000, 0.0000, -2.5000}, 4.3065},
    {{50.0000, 2.5000, 0.0000}, {73.0000, 25.0000, -18.0000}, 27.1492},
    {{50.0000, 2.5000, 0.0000}, {61.0000, -5.0000, 29.0000}, 22.8977},
    {{50.0000, 2.5000, 0.0000}, {56.0000, -27.0000, -3.0000}, 31.9030},
    {{50.0000, 2.5000, 0.0000}, {58.0000, 24.0000, 15.0000}, 19.4535},
    {{50.0000, 2.5000, 0.0000}, {50.0000, 3.1736, 0.5854}, 1.0000},
    {{50.0000, 2.5000, 0.0000}, {50.0000, 3.2972, 0.0000}, 1.0000},
    {{50.0000, 2.5000, 0.0000}, {50.0000, 1.8634, 0.5757}, 1.0000},
    {{50.0000, 2.5000, 0.0000}, {50.0000, 3.2592, 0.3350}, 1.0000},
    {{60.2574, -34.0099, 36.2677}, {60.4626, -34.1751, 39.4387}, 1.2644},
    {{63.0109, -31.0961, -5.8663}, {62.8187, -29.7946, -4.0864}, 1.2630},
    {{61.2901, 3.7196, -5.3901}, {61.4292, 2.2480, -4.9620}, 1.8731},
    {{35.0831, -44.1164, 3.7933}, {35.0232, -40.0716, 1.5901}, 1.8645},
    {{22.7233, 20.0904, -46.6940}, {23.0331, 14.9730, -42.5619}, 2.0373},
    {{36.4612, 47.8580, 18.3852}, {36.2715, 50.5065, 21.2231}, 1.4146},
    {{90.8027, -2.0831, 1.4410}, {91.1528, -1.6435, 0.0447}, 1.4441},
    {{90.9257, -0.5406, -0.9208}, {88.6381, -0.8985, -0.7239}, 1.5381},
    {{6.7747, -0.2908, -2.4247}, {5.8714, -0.0985, -2.2286}, 0.6377},
    {{2.0776, 0.0795, -1.1350}, {0.9033, -0.0636, -0.5514}, 0.9082},
};

LabColor Lab(const double v[3]) { return LabColor(v[0], v[1], v[2]); }
} // namespace

TEST_CASE("CIEDE2000 reproduces the published test pairs", "[DeltaE2000]") {
  int pairNo = 0;
  for (const ReferencePair& p : kSharmaPairs) {
    ++pairNo;
    INFO("pair " << pairNo);
    CHECK(DeltaE2000::Distance(Lab(p.lab1), Lab(p.lab2)) == Approx(p.expected).margin(1e-4));
  }
}

TEST_CASE("CIEDE2000 is symmetric with zero self-distance", "[DeltaE2000]") {
  for (const ReferencePair& p : kSharmaPairs) {
    const LabColor a = Lab(p.lab1);
    const LabColor b = Lab(p.lab2);
    CHECK(DeltaE2000::Distance(a, b) == Approx(DeltaE2000::Distance(b, a)).margin(1e-12));
    CHECK(DeltaE2000::Distance(a, a) == 0.0);
  }
}

TEST_CASE("CIEDE2000 handles zero chroma without NaN", "[DeltaE2000]") {
  SECTION("both colors neutral") {
    const double d = DeltaE2000::Distance(LabColor(50.0, 0.0, 0.0), LabColor(60.0, 0.0, 0.0));
    CHECK_FALSE(std::isnan(d));
    CHECK(d > 0.0);
  }
  SECTION("black against black") {
    CHECK(DeltaE2000::Distance(LabColor(0.0, 0.0, 0.0), LabColor(0.0, 0.0, 0.0)) == 0.0);
  }
  SECTION("one neutral, one chromatic") {
    const double d = DeltaE2000::Distance(LabColor(50.0, 0.0, 0.0), LabColor(50.0, 0.0, -20.0));
    CHECK_FALSE(std::isnan(d));
    CHECK(d > 0.0);
  }
}

TEST_CASE("DistanceToMany matches Distance in both modes", "[DeltaE2000]") {
  LabList labs;
  std::vector<uint32_t> indices;
  for (int i = 0; i < 500; ++i) {
    labs.push_back(LabColor(i % 100, (i % 37) - 18.0, (i % 53) - 26.0));
    if (i % 3 == 0) indices.push_back(static_cast<uint32_t>(i));
  }
  const LabColor reference(42.0, 5.0, -3.0);

  std::vector<double> serial;
  std::vector<double> parallel;
  DeltaE2000::DistanceToMany(reference, labs, indices, serial, false);
  DeltaE2000::DistanceToMany(reference, labs, indices, parallel, true);

  REQUIRE(serial.size() == indices.size());
  REQUIRE(parallel.size() == indices.size());
  for (size_t k = 0; k < indices.size(); ++k) {
    CHECK(serial[k] == DeltaE2000::Distance(reference, labs[indices[k]]));
    CHECK(parallel[k] == serial[k]);
  }

  std::vector<double> none(3, 1.0);
  DeltaE2000::DistanceToMany(reference, labs, std::vector<uint32_t>(), none, true);
  CHECK(none.empty());
}
