#include "ColorSetOps.h"

#include <stdexcept>
#include <vector>

RgbList ColorSetOps::SelectByMask(const RgbList& colors, const ColorMask& mask) {
  if (mask.size() != colors.size()) {
    throw std::invalid_argument("ColorSetOps::SelectByMask: mask length does not match color count.");
  }
  RgbList out;
  for (size_t i = 0; i < colors.size(); ++i) {
    if (mask[i]) out.push_back(colors[i]);
  }
  return out;
}

RgbList ColorSetOps::ReduceToGrid(const RgbList& colors, int step) {
  const int s = step < 1 ? 1 : step;
  // One bit per 24-bit value (2 MiB).
  std::vector<bool> seen(1u << 24, false);

  RgbList out;
  for (const RgbColor& c : colors) {
    RgbColor snapped((c[0] / s) * s, (c[1] / s) * s, (c[2] / s) * s);
    const uint32_t key = Pack(snapped);
    if (seen[key]) continue;
    seen[key] = true;
    out.push_back(c);
  }
  return out;
}
