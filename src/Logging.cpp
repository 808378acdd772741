#include "Logging.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace {
boost::log::trivial::severity_level g_severity = boost::log::trivial::info;

boost::log::trivial::severity_level LevelToBoost(unsigned int level) {
  switch (level) {
  case 0: return boost::log::trivial::fatal;
  case 1: return boost::log::trivial::error;
  case 2: return boost::log::trivial::warning;
  case 3: return boost::log::trivial::info;
  case 4: return boost::log::trivial::debug;
  default: return boost::log::trivial::trace;
  }
}

const char* const kLevelNames[] = {"fatal", "error", "warning", "info", "debug", "trace"};
} // namespace

void SetLoggingLevel(unsigned int level) {
  g_severity = LevelToBoost(level);
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= g_severity);
}

unsigned int GetLoggingLevel() {
  switch (g_severity) {
  case boost::log::trivial::fatal: return 0;
  case boost::log::trivial::error: return 1;
  case boost::log::trivial::warning: return 2;
  case boost::log::trivial::info: return 3;
  case boost::log::trivial::debug: return 4;
  case boost::log::trivial::trace: return 5;
  default: return 3;
  }
}

bool ParseLoggingLevel(const std::string& text, unsigned int& outLevel) {
  const std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
  if (value.size() == 1 && value[0] >= '0' && value[0] <= '5') {
    outLevel = static_cast<unsigned int>(value[0] - '0');
    return true;
  }
  for (unsigned int i = 0; i < 6; ++i) {
    if (value == kLevelNames[i]) {
      outLevel = i;
      return true;
    }
  }
  return false;
}

std::string LoggingLevelName(unsigned int level) {
  return level < 6 ? kLevelNames[level] : "trace";
}
