#include "ColorSpaceConverter.h"

#include <array>
#include <cmath>

namespace {
// sRGB -> XYZ (D65), rows X, Y, Z.
const double kSrgbToXyz[3][3] = {
    {0.4124564, 0.3575761, 0.1804375},
    {0.2126729, 0.7151522, 0.0721750},
    {0.0193339, 0.1191920, 0.9503041}};

// D65 reference white.
const double kWhiteD65[3] = {0.95047, 1.00000, 1.08883};

const double kLabEpsilon = 0.008856;
const double kLabKappa = 903.3;

// 8-bit channel -> linear light, computed once.
const std::array<double, 256>& SrgbToLinearTable() {
  static const std::array<double, 256> table = [] {
    std::array<double, 256> t{};
    for (int i = 0; i < 256; ++i) {
      const double c = i / 255.0;
      t[i] = (c <= 0.04045) ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
    }
    return t;
  }();
  return table;
}

// XYZ matrix with each row already divided by the matching white component.
const cv::Matx33d& WhiteNormalizedMatrix() {
  static const cv::Matx33d m = [] {
    cv::Matx33d out;
    for (int r = 0; r < 3; ++r) {
      for (int c = 0; c < 3; ++c) {
        out(r, c) = kSrgbToXyz[r][c] / kWhiteD65[r];
      }
    }
    return out;
  }();
  return m;
}

inline double LabF(double t) {
  return (t > kLabEpsilon) ? std::cbrt(t) : (kLabKappa * t + 16.0) / 116.0;
}

inline cv::Vec3d NormalizedXyzToLab(const cv::Vec3d& xyz) {
  const double fx = LabF(xyz[0]);
  const double fy = LabF(xyz[1]);
  const double fz = LabF(xyz[2]);
  return cv::Vec3d(116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz));
}
} // namespace

cv::Mat ColorSpaceConverter::RgbToLabMat(const cv::Mat& rgb) {
  if (rgb.empty() || rgb.type() != CV_8UC3) return {};

  const std::array<double, 256>& table = SrgbToLinearTable();
  const cv::Mat lut(1, 256, CV_64F, const_cast<double*>(table.data()));

  // Step 1: inverse gamma, channel-wise, 8-bit -> double.
  cv::Mat linear;
  cv::LUT(rgb, lut, linear);

  // Step 2: linear RGB -> XYZ / white (one 3x3 transform per element).
  cv::Mat xyz;
  cv::transform(linear, xyz, cv::Mat(WhiteNormalizedMatrix()));

  // Step 3: CIE nonlinearity, in place.
  xyz.forEach<cv::Vec3d>([](cv::Vec3d& p, const int*) { p = NormalizedXyzToLab(p); });
  return xyz;
}

LabList ColorSpaceConverter::RgbToLab(const RgbList& colors) {
  if (colors.empty()) return {};

  const cv::Mat rgbView(static_cast<int>(colors.size()), 1, CV_8UC3,
                        const_cast<RgbColor*>(colors.data()));
  const cv::Mat labMat = RgbToLabMat(rgbView);

  LabList out(colors.size());
  cv::Mat outView(static_cast<int>(out.size()), 1, CV_64FC3, out.data());
  labMat.copyTo(outView);
  return out;
}

LabColor ColorSpaceConverter::RgbToLab(const RgbColor& color) {
  const std::array<double, 256>& table = SrgbToLinearTable();
  const cv::Vec3d linear(table[color[0]], table[color[1]], table[color[2]]);
  return NormalizedXyzToLab(WhiteNormalizedMatrix() * linear);
}

double ColorSpaceConverter::Chroma(const LabColor& lab) {
  return std::sqrt(lab[1] * lab[1] + lab[2] * lab[2]);
}
