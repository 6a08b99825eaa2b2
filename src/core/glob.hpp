#pragma once

#include <string>
#include <vector>

// Shell-style glob matching on '/'-separated paths.
//
//   *      any run of characters within one path segment
//   **/    zero or more whole segments
//   **     (elsewhere) any run of characters, separators included
//   ?      exactly one non-separator character
//   [abc]  [a-z]  [!x]   character classes
//
// Backslashes in either argument are treated as '/'. Matching is
// case-insensitive unless case_sensitive is set.
//
// Throws std::invalid_argument on an empty pattern. An empty path never matches.
bool glob_match(const std::string& pattern, const std::string& path,
                bool case_sensitive = false);

// Paths that match, in input order.
std::vector<std::string> glob_filter(const std::string& pattern,
                                     const std::vector<std::string>& paths,
                                     bool case_sensitive = false);

// Directory portion of the pattern that precedes its first wildcard
// ("logs/2024/*.txt" -> "logs/2024", "*.txt" -> "").
std::string glob_base_path(const std::string& pattern);

// True if the pattern contains any wildcard character.
bool glob_has_wildcard(const std::string& pattern);
