#pragma once

#include "ColorTypes.h"

#include <iosfwd>
#include <string>
#include <vector>

// ColorListFile: text I/O for color lists.
// Format:
//   line 1        header, always skipped
//   other lines   "R, G, B" with integers in [0, 255]; blank lines and lines starting with '#' are ignored
// Anything else fails the whole load with "<file>:<line>: <reason>"; nothing partial is returned.
class ColorListFile {
public:
  static constexpr const char* kHeader = "# R, G, B";

  static bool Load(const std::string& path, RgbList& outColors, std::string& outError);

  // Writes to a temporary sibling first and renames it over path, so a failed save leaves no partial file.
  static bool Save(const std::string& path, const RgbList& colors, std::string& outError);

  // Saves lists[i] to paths[i] as one unit: all files are staged as .tmp siblings before any is renamed.
  // On failure no target written by this call is left behind, and every .tmp is removed.
  static bool SaveAll(const std::vector<std::string>& paths, const std::vector<RgbList>& lists,
                      std::string& outError);

  // sourceName only labels error messages.
  static bool Parse(std::istream& in, const std::string& sourceName, RgbList& outColors, std::string& outError);
  static void Write(std::ostream& out, const RgbList& colors);
};
