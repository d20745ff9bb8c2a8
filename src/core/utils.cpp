#include "utils.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string shell_quote(const std::string& word) {
    std::string out;
    out.reserve(word.size() + 2);
    out += '\'';
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string format_mode(std::uint32_t mode) {
    std::string out;
    out += ((mode & MODE_TYPE_MASK) == MODE_DIRECTORY) ? 'd' : '-';
    const char* flags = "rwxrwxrwx";
    for (int i = 0; i < 9; i++) {
        out += (mode & (0400u >> i)) ? flags[i] : '-';
    }
    return out;
}

std::string format_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}
