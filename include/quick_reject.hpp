#pragma once
#include "keyspot_common.hpp"

// -------- Quick-reject filter --------

inline constexpr size_t PHRASE_MIN_LEN = 16;       // space + longer than 15 => phrase
inline constexpr size_t MAX_REPEAT_RUN = 4;
inline constexpr double MAX_RUN_SHARE = 0.3;

// true => obviously not a secret, skip the remaining stages
bool quick_reject(const Text& s, size_t n);

bool contains_placeholder_marker(const Text& lower);
bool has_excessive_repetition(const Text& s);
bool looks_like_url(const Text& lower);
bool looks_like_email(const Text& s);
bool looks_like_path(const Text& s);
