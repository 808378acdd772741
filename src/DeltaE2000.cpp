#include "DeltaE2000.h"

#include <cmath>

namespace {
const double kPi = 3.14159265358979323846;
const double k25Pow7 = 6103515625.0; // 25^7

inline double DegToRad(double deg) { return deg * (kPi / 180.0); }
inline double RadToDeg(double rad) { return rad * (180.0 / kPi); }

inline double Pow7(double v) {
  const double v2 = v * v;
  const double v3 = v2 * v;
  return v3 * v3 * v;
}

// Hue angle in [0, 360). atan2(0, 0) is 0, which is the conventional hue of a neutral.
inline double HueDegrees(double b, double aPrime) {
  if (b == 0.0 && aPrime == 0.0) return 0.0;
  double h = RadToDeg(std::atan2(b, aPrime));
  if (h < 0.0) h += 360.0;
  return h;
}
} // namespace

double DeltaE2000::Distance(const LabColor& lab1, const LabColor& lab2) {
  const double L1 = lab1[0], a1 = lab1[1], b1 = lab1[2];
  const double L2 = lab2[0], a2 = lab2[1], b2 = lab2[2];

  // Chroma correction G from the mean chroma.
  const double C1 = std::sqrt(a1 * a1 + b1 * b1);
  const double C2 = std::sqrt(a2 * a2 + b2 * b2);
  const double CMean7 = Pow7((C1 + C2) / 2.0);
  const double G = 0.5 * (1.0 - std::sqrt(CMean7 / (CMean7 + k25Pow7)));

  const double a1p = a1 * (1.0 + G);
  const double a2p = a2 * (1.0 + G);
  const double C1p = std::sqrt(a1p * a1p + b1 * b1);
  const double C2p = std::sqrt(a2p * a2p + b2 * b2);
  const double h1p = HueDegrees(b1, a1p);
  const double h2p = HueDegrees(b2, a2p);
  const double chromaProduct = C1p * C2p;

  const double dLp = L2 - L1;
  const double dCp = C2p - C1p;

  // Hue difference wrapped into (-180, 180].
  double dhp = 0.0;
  if (chromaProduct != 0.0) {
    dhp = h2p - h1p;
    if (dhp > 180.0) {
      dhp -= 360.0;
    } else if (dhp < -180.0) {
      dhp += 360.0;
    }
  }
  const double dHp = 2.0 * std::sqrt(chromaProduct) * std::sin(DegToRad(dhp / 2.0));

  const double LMean = (L1 + L2) / 2.0;
  const double CpMean = (C1p + C2p) / 2.0;

  // Mean hue, with the wraparound case when the hues sit on either side of 0/360.
  double hpMean = h1p + h2p;
  if (chromaProduct != 0.0) {
    if (std::fabs(h1p - h2p) <= 180.0) {
      hpMean = (h1p + h2p) / 2.0;
    } else if (h1p + h2p < 360.0) {
      hpMean = (h1p + h2p + 360.0) / 2.0;
    } else {
      hpMean = (h1p + h2p - 360.0) / 2.0;
    }
  }

  const double T = 1.0
      - 0.17 * std::cos(DegToRad(hpMean - 30.0))
      + 0.24 * std::cos(DegToRad(2.0 * hpMean))
      + 0.32 * std::cos(DegToRad(3.0 * hpMean + 6.0))
      - 0.20 * std::cos(DegToRad(4.0 * hpMean - 63.0));

  const double LOffset2 = (LMean - 50.0) * (LMean - 50.0);
  const double SL = 1.0 + (0.015 * LOffset2) / std::sqrt(20.0 + LOffset2);
  const double SC = 1.0 + 0.045 * CpMean;
  const double SH = 1.0 + 0.015 * CpMean * T;

  // Blue-region rotation: Gaussian centered at 275 deg, sigma 25 deg.
  const double hueOffset = (hpMean - 275.0) / 25.0;
  const double dTheta = 30.0 * std::exp(-hueOffset * hueOffset);
  const double CpMean7 = Pow7(CpMean);
  const double RC = 2.0 * std::sqrt(CpMean7 / (CpMean7 + k25Pow7));
  const double RT = -RC * std::sin(DegToRad(2.0 * dTheta));

  const double tL = dLp / SL;
  const double tC = dCp / SC;
  const double tH = dHp / SH;
  const double sum = tL * tL + tC * tC + tH * tH + RT * tC * tH;
  // The RT cross term cannot push a real pair below zero; guard rounding noise only.
  return sum > 0.0 ? std::sqrt(sum) : 0.0;
}

void DeltaE2000::DistanceToMany(const LabColor& reference,
                                const LabList& labs,
                                const std::vector<uint32_t>& indices,
                                std::vector<double>& outDistances,
                                bool parallel) {
  outDistances.resize(indices.size());
  if (indices.empty()) return;

  if (!parallel) {
    for (size_t k = 0; k < indices.size(); ++k) {
      outDistances[k] = Distance(reference, labs[indices[k]]);
    }
    return;
  }

  // Each slot is written by exactly one worker; labs is never modified.
  cv::parallel_for_(cv::Range(0, static_cast<int>(indices.size())), [&](const cv::Range& range) {
    for (int k = range.start; k < range.end; ++k) {
      outDistances[k] = Distance(reference, labs[indices[k]]);
    }
  });
}
