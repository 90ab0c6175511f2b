#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Quote a single word for a POSIX shell. Words made only of
// [A-Za-z0-9_@%+=:,./-] are returned bare; anything else is wrapped in
// single quotes, with embedded quotes written as '"'"'.
std::string shell_quote(const std::string& word);

// Join words with a single space, quoting each one with shell_quote().
std::string shell_join(const std::vector<std::string>& words);
