#pragma once
#include "keyspot_common.hpp"

// -------- Hard-signal matcher --------

// Outcome of structural matching. Undecided hands over to soft scoring.
enum class HardSignal { Positive, Negative, Undecided };

// Vendor key prefixes; min_length 0 means only the generic floor applies.
struct KnownPrefix {
    const char* prefix;
    size_t min_length;
};

inline constexpr size_t GENERIC_PREFIX_MIN_LEN = 16;
inline constexpr size_t JWT_MIN_LEN = 100;
inline constexpr size_t JWT_MIN_SEGMENT_LEN = 8;
inline constexpr size_t HEX_MIN_LEN = 32;
inline constexpr size_t HEX_MAX_LEN = 128;
inline constexpr size_t BASE64_MIN_LEN = 32;

HardSignal hard_signal(const Text& s, size_t n);

// individual matchers, exposed for tests
bool has_known_prefix(const Text& s);
bool known_prefix_satisfied(const Text& s, size_t n);
bool looks_like_jwt(const Text& s);
bool looks_like_hex_blob(const Text& s, size_t n);
bool looks_like_base64_blob(const Text& s, size_t n);

// Hosts whose names act as credential identifiers (OAuth client ids etc).
// `lower` must already be lowercased.
bool contains_secret_domain(const Text& lower);
