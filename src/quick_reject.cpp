#include "quick_reject.hpp"
#include "char_stats.hpp"
#include "hard_signal.hpp"
#include "secure_text.hpp"
#include "text.hpp"

#include <array>

static constexpr std::array<const char*, 19> PLACEHOLDER_MARKERS = {
    "example", "test", "sample", "placeholder", "your_key_here",
    "password", "secret", "token", "apikey", "api_key",
    "lorem", "ipsum", "dummy", "mock", "fake",
    "xxxxxxxxxx", "123456789", "undefined", "null",
};

static constexpr std::array<const char*, 3> URL_SCHEMES = { "http://", "https://", "www." };
static constexpr std::array<const char*, 3> URL_PATH_MARKERS = { ".com/", ".org/", ".net/" };


bool contains_placeholder_marker(const Text& lower) {
    return std::any_of(PLACEHOLDER_MARKERS.begin(), PLACEHOLDER_MARKERS.end(),
        [&lower](const char* m) { return contains(lower, m); });
}

bool has_excessive_repetition(const Text& s) {
    if (s.empty()) return false;
    size_t run = longest_run(s);
    return run >= MAX_REPEAT_RUN ||
        static_cast<double>(run) / static_cast<double>(s.size()) > MAX_RUN_SHARE;
}

bool looks_like_url(const Text& lower) {
    // OAuth client ids and tenant hosts are left to the hard-signal stage
    if (contains_secret_domain(lower)) return false;

    for (const char* scheme : URL_SCHEMES) {
        if (starts_with(lower, scheme)) return true;
    }
    for (const char* marker : URL_PATH_MARKERS) {
        if (contains(lower, marker)) return true;
    }
    return false;
}

bool looks_like_email(const Text& s) {
    return contains_char(s, U'@') && contains_char(s, U'.');
}

bool looks_like_path(const Text& s) {
    return count_char(s, U'/') >= 2;
}


// ---------------- Quick-reject stage ----------------
bool quick_reject(const Text& s, size_t n) {
    SecureText lower(to_lower_ascii(s));

    if (contains_placeholder_marker(lower.str())) return true;
    if (contains_char(s, U' ') && n >= PHRASE_MIN_LEN) return true;
    if (has_excessive_repetition(s)) return true;
    if (looks_like_url(lower.str())) return true;
    if (looks_like_email(s)) return true;
    if (looks_like_path(s)) return true;
    return false;
}
