#pragma once

#include <string>

// Lower-case ASCII copy.
std::string to_lower(const std::string& s);

// Case-insensitive substring search.
bool contains_icase(const std::string& haystack, const std::string& needle);

// Replace every backslash with a forward slash.
std::string normalize_slashes(const std::string& path);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
