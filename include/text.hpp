#pragma once
#include "keyspot_common.hpp"

#include <string_view>

// -------- UTF-8 decoding --------

// Decode UTF-8 into scalar values. Malformed sequences (truncated,
// overlong, surrogates, > U+10FFFF) become one U+FFFD per offending byte.
Text decode_utf8(const std::string& raw);

inline constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

// -------- Character classes --------
bool is_unicode_space(char32_t c);

inline bool is_ascii_digit(char32_t c) { return c >= U'0' && c <= U'9'; }
inline bool is_ascii_upper(char32_t c) { return c >= U'A' && c <= U'Z'; }
inline bool is_ascii_lower(char32_t c) { return c >= U'a' && c <= U'z'; }
inline bool is_ascii_letter(char32_t c) { return is_ascii_upper(c) || is_ascii_lower(c); }
inline bool is_ascii_alnum(char32_t c) { return is_ascii_digit(c) || is_ascii_letter(c); }

inline bool is_hex_digit(char32_t c) {
    return is_ascii_digit(c) || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
}

inline bool is_base64_char(char32_t c) {
    return is_ascii_alnum(c) || c == U'+' || c == U'/' || c == U'=';
}

inline bool is_base64url_char(char32_t c) {
    return is_ascii_alnum(c) || c == U'-' || c == U'_';
}

// -------- Text helpers (needles are ASCII) --------
Text trim(const Text& s);

// Trim in place. Vacated trailing elements are wiped before the shrink.
void trim_in_place(Text& s);
Text to_lower_ascii(const Text& s);

bool contains(const Text& s, std::string_view needle);
bool starts_with(const Text& s, std::string_view prefix);
bool ends_with(const Text& s, std::string_view suffix);
bool contains_char(const Text& s, char32_t c);
size_t count_char(const Text& s, char32_t c);

// -------- Normalizer --------

// Trim, strip one matching pair of surrounding " or ' quotes, trim again.
// Works on the caller's buffer without reallocating it.
void normalize_in_place(Text& t);

Text normalize(const Text& raw);
