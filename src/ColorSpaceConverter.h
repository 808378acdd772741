#pragma once

#include "ColorTypes.h"

// ColorSpaceConverter:
// - Pure, stateless sRGB (8-bit) -> CIE L*a*b* conversion (D65 white).
// - Batch conversion runs over a cv::Mat view of the whole list so OpenCV can vectorize it:
//   1) LUT: 8-bit channel -> linear light (inverse sRGB gamma)
//   2) cv::transform with the sRGB->XYZ matrix, pre-divided by the D65 reference white
//   3) per-element CIE nonlinearity (Mat::forEach, parallel)
class ColorSpaceConverter {
public:
  static LabList RgbToLab(const RgbList& colors);
  static LabColor RgbToLab(const RgbColor& color);

  // Input: N x 1 CV_8UC3 (R,G,B). Output: N x 1 CV_64FC3 (L,a,b).
  static cv::Mat RgbToLabMat(const cv::Mat& rgb);

  static double Chroma(const LabColor& lab);
};
