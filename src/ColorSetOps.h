#pragma once

#include "ColorTypes.h"

// Small order-preserving operations on color lists.
class ColorSetOps {
public:
  // Colors whose mask byte is non-zero, in input order. mask must be the same length as colors.
  static RgbList SelectByMask(const RgbList& colors, const ColorMask& mask);

  // Snaps each channel to (c / step) * step and keeps the first color of every snapped value.
  // step <= 1 only removes exact duplicates.
  static RgbList ReduceToGrid(const RgbList& colors, int step);

  // 0xRRGGBB
  static uint32_t Pack(const RgbColor& color) {
    return (static_cast<uint32_t>(color[0]) << 16) | (static_cast<uint32_t>(color[1]) << 8) | color[2];
  }
};
