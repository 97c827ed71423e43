#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Base64 (RFC 4648, padded). Decoding skips whitespace and stops at '=' or
// the first invalid character.
std::string base64_encode(const std::string& input);
std::string base64_decode(const std::string& input);

// Join with a separator ("a", "b" + "\n" -> "a\nb").
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Split on whitespace runs.
std::vector<std::string> split_ws(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
