#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Remote paths are opaque POSIX strings; nothing here touches the local
// filesystem.

std::string join_remote_path(const std::string& dir, const std::string& name);
std::string remote_basename(const std::string& path);
std::string remote_dirname(const std::string& path);

// n == 1 -> "report copy.txt", n >= 2 -> "report copy 2.txt". The suffix goes
// before the last extension of files; directories, dotfiles and names without
// an extension get it at the end.
std::string copy_name_candidate(const std::string& name, bool is_directory, int n);

// First candidate not present in `existing`.
Result<std::string> unique_copy_name(const std::string& name, bool is_directory,
                                     const std::vector<FileEntry>& existing);

// ── Archives ────────────────────────────────────────────────────

enum class ArchiveFormat { Zip, TarGz, TarBz2, TarXz, Tar, Unknown };

ArchiveFormat detect_archive_format(const std::string& filename);

// Remote tool needed to unpack the format ("unzip" or "tar").
const char* archive_tool(ArchiveFormat format);

// Shell command that unpacks `archive_name` inside `dir`. Unknown -> "".
std::string extract_command(ArchiveFormat format, const std::string& dir,
                            const std::string& archive_name);

// Shell command zipping `names` (entries of `dir`) into `archive_name`.
std::string zip_command(const std::string& dir, const std::string& archive_name,
                        const std::vector<std::string>& names);

std::string with_zip_extension(const std::string& name);

// ── Listing order ───────────────────────────────────────────────

enum class SortKey { Name, Size, Modified };

// Directories first, then by key. Name order is case-insensitive.
void sort_listing(std::vector<FileEntry>& entries, SortKey key, bool ascending = true);
