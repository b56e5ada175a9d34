#pragma once

#include <optional>
#include <string>
#include <vector>

namespace locus {

// String-based path helpers shared by the resource variants
// All paths use '/' as separator; no filesystem access happens here
namespace path_utils {

// Split path into non-empty segments
std::vector<std::string> split_path(const std::string& path);

// Normalize separators and collapse "." and ".." segments
//   "a\\b/./c/../d" -> "a/b/d"
//   "/a/../../b"    -> "/../b"   (leading ".." kept when nothing left to pop)
//   "file:a/./b"    -> "file:a/b" (scheme-like prefix preserved)
std::string clean_path(const std::string& path);

// Resolve relative_path against the directory of path
//   ("a/b.txt", "c.txt")  -> "a/c.txt"
//   ("b.txt", "c.txt")    -> "c.txt"
//   ("a/b.txt", "/c.txt") -> "a/c.txt"
std::string apply_relative_path(const std::string& path, const std::string& relative_path);

// Last segment after the final '/', or nullopt for an empty path
std::optional<std::string> filename(const std::string& path);

// Remove exactly one leading '/' if present
std::string strip_leading_slash(const std::string& path);

bool starts_with(const std::string& text, const std::string& prefix);

} // namespace path_utils

} // namespace locus
