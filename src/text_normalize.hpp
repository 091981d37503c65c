#pragma once

#include <cstddef>
#include <string>
#include <vector>

// UTF-8 helpers. Invalid sequences decode to U+FFFD and never stop the walk.
std::vector<char32_t> decode_utf8(const std::string& s);
void append_utf8(std::string& out, char32_t cp);

bool is_unicode_space(char32_t cp);

// Removes every "**", then every "//", left to right without overlap.
std::string strip_markup(const std::string& s);

// Comparison key: all whitespace removed, lower-cased.
std::string normalize_text(const std::string& s);

// Number of non-whitespace code points.
std::size_t char_len(const std::string& s);

// Fraction of non-whitespace code points below 128; 0.0 when there are none.
double ascii_ratio(const std::string& s);

bool has_ascii_letter(const std::string& s);

std::string trim_whitespace(const std::string& s);

// Trimmed, newlines replaced by spaces, first max_chars code points.
std::string make_preview(const std::string& s, std::size_t max_chars = 60);
