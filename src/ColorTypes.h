#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <vector>

// Shared color containers.
// NOTE: RgbColor is stored in R, G, B order, NOT OpenCV's usual BGR order.
// Color lists are read from and written to text files in R, G, B order, so we keep that order end to end.
using RgbColor = cv::Vec3b;

// CIE L*a*b* triple: L in [0,100], a/b signed (typically [-128,128]).
using LabColor = cv::Vec3d;

using RgbList = std::vector<RgbColor>;
using LabList = std::vector<LabColor>;

// One byte per color; used for keep/in-gamut masks.
using ColorMask = std::vector<uint8_t>;
