#pragma once

#include <string>
#include <cstdint>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Quote one word for a POSIX shell: wraps in single quotes and rewrites
// every embedded ' as '\''. The result is always exactly one shell word.
std::string shell_quote(const std::string& word);

// Expand a leading "~/" against the local home directory.
std::string expand_home(const std::string& path);

// Render permission bits as "rwxr-xr-x" (directory flag prefixed as 'd').
std::string format_mode(std::uint32_t mode);

// Human readable byte count ("512 B", "1.5 KB", ...).
std::string format_size(std::uint64_t bytes);
