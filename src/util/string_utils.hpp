#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);

// Split a command line into words. Single and double quotes group words,
// a backslash escapes the next character outside single quotes.
std::vector<std::string> tokenize(const std::string& line);
}
