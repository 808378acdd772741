#include "ColorListFile.h"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/log/trivial.hpp>

#include <fstream>
#include <sstream>
#include <vector>

namespace {
std::string Located(const std::string& source, size_t lineNo, const std::string& reason) {
  std::ostringstream os;
  os << source << ":" << lineNo << ": " << reason;
  return os.str();
}

// One data row -> color. Returns an empty string on success, otherwise the reason.
std::string ParseRow(const std::string& line, RgbColor& outColor) {
  std::vector<std::string> fields;
  boost::algorithm::split(fields, line, boost::algorithm::is_any_of(","));
  if (fields.size() != 3) {
    std::ostringstream os;
    os << "expected 3 comma-separated values, found " << fields.size();
    return os.str();
  }
  for (int c = 0; c < 3; ++c) {
    const std::string field = boost::algorithm::trim_copy(fields[c]);
    int value = 0;
    if (field.empty() || !boost::conversion::try_lexical_convert(field, value)) {
      return "'" + field + "' is not an integer";
    }
    if (value < 0 || value > 255) {
      std::ostringstream os;
      os << "channel value " << value << " is outside [0, 255]";
      return os.str();
    }
    outColor[c] = static_cast<uchar>(value);
  }
  return std::string();
}
} // namespace

bool ColorListFile::Parse(std::istream& in, const std::string& sourceName, RgbList& outColors, std::string& outError) {
  outError.clear();
  outColors.clear();

  RgbList colors;
  std::string line;
  size_t lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (lineNo == 1) continue; // header
    boost::algorithm::trim(line);
    if (line.empty() || line[0] == '#') continue;

    RgbColor color;
    const std::string reason = ParseRow(line, color);
    if (!reason.empty()) {
      outError = Located(sourceName, lineNo, reason);
      return false;
    }
    colors.push_back(color);
  }
  if (in.bad()) {
    outError = Located(sourceName, lineNo, "read error");
    return false;
  }

  outColors.swap(colors);
  return true;
}

bool ColorListFile::Load(const std::string& path, RgbList& outColors, std::string& outError) {
  outError.clear();
  outColors.clear();

  std::ifstream in(path);
  if (!in) {
    boost::system::error_code ec;
    const boost::filesystem::path resolved = boost::filesystem::absolute(path);
    outError = "Cannot open color list " + resolved.string() +
               (boost::filesystem::exists(resolved, ec) ? " (permission denied?)" : " (file not found)");
    return false;
  }
  if (!Parse(in, path, outColors, outError)) return false;

  BOOST_LOG_TRIVIAL(info) << "Loaded " << outColors.size() << " colors from " << path;
  return true;
}

void ColorListFile::Write(std::ostream& out, const RgbList& colors) {
  out << kHeader << "\n";
  for (const RgbColor& c : colors) {
    out << static_cast<int>(c[0]) << ", " << static_cast<int>(c[1]) << ", " << static_cast<int>(c[2]) << "\n";
  }
}

bool ColorListFile::Save(const std::string& path, const RgbList& colors, std::string& outError) {
  return SaveAll(std::vector<std::string>{path}, std::vector<RgbList>{colors}, outError);
}

bool ColorListFile::SaveAll(const std::vector<std::string>& paths, const std::vector<RgbList>& lists,
                            std::string& outError) {
  outError.clear();
  if (paths.size() != lists.size()) {
    outError = "SaveAll: " + std::to_string(paths.size()) + " paths for " + std::to_string(lists.size()) + " lists.";
    return false;
  }

  boost::system::error_code ec;
  std::vector<boost::filesystem::path> temps;
  temps.reserve(paths.size());

  // Stage 1: every list goes to its .tmp sibling. Nothing is renamed until all of them are written.
  for (size_t i = 0; i < paths.size(); ++i) {
    const boost::filesystem::path temp = paths[i] + ".tmp";
    temps.push_back(temp);
    std::ofstream out(temp.string(), std::ios::out | std::ios::trunc);
    if (out) {
      Write(out, lists[i]);
      out.flush();
    }
    if (!out) {
      outError = "Cannot write " + boost::filesystem::absolute(temp).string();
      out.close();
      for (const boost::filesystem::path& t : temps) boost::filesystem::remove(t, ec);
      return false;
    }
  }

  // Stage 2: move them into place. A failed rename takes back the files already moved.
  for (size_t i = 0; i < paths.size(); ++i) {
    const boost::filesystem::path target(paths[i]);
    boost::filesystem::rename(temps[i], target, ec);
    if (ec) {
      outError = "Cannot move output into place at " + boost::filesystem::absolute(target).string() + ": " + ec.message();
      for (size_t k = 0; k < i; ++k) boost::filesystem::remove(paths[k], ec);
      for (size_t k = i; k < temps.size(); ++k) boost::filesystem::remove(temps[k], ec);
      return false;
    }
  }

  for (size_t i = 0; i < paths.size(); ++i) {
    BOOST_LOG_TRIVIAL(info) << "Wrote " << lists[i].size() << " colors to " << paths[i];
  }
  return true;
}
