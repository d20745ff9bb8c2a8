#include "remote_paths.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <set>

std::string join_remote_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string remote_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string remote_dirname(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string copy_name_candidate(const std::string& name, bool is_directory, int n) {
    std::string suffix = COPY_SUFFIX;
    if (n > 1) suffix += " " + std::to_string(n);

    auto dot = name.find_last_of('.');
    if (is_directory || dot == std::string::npos || dot == 0) {
        return name + suffix;
    }
    return name.substr(0, dot) + suffix + name.substr(dot);
}

Result<std::string> unique_copy_name(const std::string& name, bool is_directory,
                                     const std::vector<FileEntry>& existing) {
    std::set<std::string> taken;
    for (const auto& e : existing) taken.insert(e.name);

    for (int n = 1; n <= MAX_COPY_NAME_ATTEMPTS; n++) {
        std::string candidate = copy_name_candidate(name, is_directory, n);
        if (!taken.count(candidate)) return Result<std::string>::Ok(candidate);
    }
    return Result<std::string>::Err(ErrorKind::RemoteIO,
                                    "No free copy name for " + name);
}

// ── Archives ────────────────────────────────────────────────────

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ArchiveFormat detect_archive_format(const std::string& filename) {
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ends_with(lower, ".zip")) return ArchiveFormat::Zip;
    if (ends_with(lower, ".tar.gz") || ends_with(lower, ".tgz")) return ArchiveFormat::TarGz;
    if (ends_with(lower, ".tar.bz2") || ends_with(lower, ".tbz2")) return ArchiveFormat::TarBz2;
    if (ends_with(lower, ".tar.xz") || ends_with(lower, ".txz")) return ArchiveFormat::TarXz;
    if (ends_with(lower, ".tar")) return ArchiveFormat::Tar;
    return ArchiveFormat::Unknown;
}

const char* archive_tool(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:     return "unzip";
        case ArchiveFormat::TarGz:
        case ArchiveFormat::TarBz2:
        case ArchiveFormat::TarXz:
        case ArchiveFormat::Tar:     return "tar";
        case ArchiveFormat::Unknown: break;
    }
    return "";
}

std::string extract_command(ArchiveFormat format, const std::string& dir,
                            const std::string& archive_name) {
    std::string unpack;
    switch (format) {
        // -o: never stop at an overwrite prompt, exec has no stdin
        case ArchiveFormat::Zip:     unpack = "unzip -o"; break;
        case ArchiveFormat::TarGz:   unpack = "tar -xzf"; break;
        case ArchiveFormat::TarBz2:  unpack = "tar -xjf"; break;
        case ArchiveFormat::TarXz:   unpack = "tar -xJf"; break;
        case ArchiveFormat::Tar:     unpack = "tar -xf"; break;
        case ArchiveFormat::Unknown: return "";
    }
    return fmt::format("cd {} && {} {}", shell_quote(dir), unpack,
                       shell_quote("./" + archive_name));
}

std::string zip_command(const std::string& dir, const std::string& archive_name,
                        const std::vector<std::string>& names) {
    std::string cmd = fmt::format("cd {} && zip -r {}", shell_quote(dir),
                                  shell_quote("./" + archive_name));
    for (const auto& n : names) {
        cmd += " " + shell_quote("./" + n);
    }
    return cmd;
}

std::string with_zip_extension(const std::string& name) {
    return ends_with(name, ".zip") ? name : name + ".zip";
}

// ── Listing order ───────────────────────────────────────────────

static std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void sort_listing(std::vector<FileEntry>& entries, SortKey key, bool ascending) {
    std::stable_sort(entries.begin(), entries.end(),
        [&](const FileEntry& a, const FileEntry& b) {
            if (a.is_directory != b.is_directory) return a.is_directory;
            bool less, greater;
            switch (key) {
                case SortKey::Size:
                    less = a.size < b.size;
                    greater = a.size > b.size;
                    break;
                case SortKey::Modified:
                    less = a.modified_at < b.modified_at;
                    greater = a.modified_at > b.modified_at;
                    break;
                default: {
                    std::string la = lowercase(a.name), lb = lowercase(b.name);
                    less = la < lb;
                    greater = la > lb;
                }
            }
            return ascending ? less : greater;
        });
}
