#pragma once

#include <string>

// Get the local operator id: credential store "operator", then $USER.
// Returns "unknown" if neither is available.
std::string get_local_operator();

// True if s is non-empty and every character is an ASCII digit.
bool is_all_digits(const std::string& s);

// Percent-encode a query-string component (RFC 3986 unreserved set kept).
std::string url_encode(const std::string& s);

// First `max_chars` characters of a UTF-8 string; never splits a sequence.
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Reduce a mention to a bare operator id.
// Accepts "[CQ:at,qq=ID]", "[At:ID]", "Name(ID)" or a plain id.
std::string extract_operator_id(const std::string& raw);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
