#pragma once

#include <string>

// Severity control for the Boost.Log trivial logger.
// Levels: 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
void SetLoggingLevel(unsigned int level);
unsigned int GetLoggingLevel();

// Accepts a level number ("0".."5") or a name ("fatal".."trace"). Returns false on anything else.
bool ParseLoggingLevel(const std::string& text, unsigned int& outLevel);
std::string LoggingLevelName(unsigned int level);
