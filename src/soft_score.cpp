#include "soft_score.hpp"
#include "char_stats.hpp"
#include "secure_text.hpp"
#include "text.hpp"

#include <array>

static constexpr std::array<const char*, 44> COMMON_WORDS = {
    "the", "and", "for", "are", "but", "not", "you", "all",
    "can", "her", "was", "one", "our", "out", "get", "has",
    "him", "his", "how", "man", "new", "now", "old", "see",
    "way", "who", "boy", "did", "its", "let", "put", "say",
    "she", "too", "use", "data", "user", "file", "name",
    "path", "temp", "admin", "config", "debug",
};

double length_bonus(size_t n) {
    if (n >= 40) return 1.5;
    if (n >= 32) return 1.2;
    if (n >= 24) return 0.8;
    if (n >= 16) return 0.3;
    return 0.0;
}

double length_threshold(size_t n) {
    if (n >= 32) return 2.0;
    if (n >= 20) return 2.5;
    return 3.0;
}

static double variety_bonus(double variety) {
    if (variety >= 0.75) return 1.0;
    if (variety >= 0.50) return 0.5;
    return 0.0;
}

static double entropy_bonus(double entropy) {
    if (entropy >= 4.5) return 2.0;
    if (entropy >= 4.0) return 1.5;
    if (entropy >= 3.5) return 1.0;
    if (entropy >= 3.0) return 0.5;
    return -0.5;
}

bool looks_like_filename(const Text& s) {
    size_t dot = s.rfind(U'.');
    if (dot == Text::npos) return false;

    size_t ext_len = s.size() - dot - 1;
    if (ext_len < 2 || ext_len > 5) return false;
    return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(dot) + 1, s.end(), is_ascii_letter);
}

bool contains_common_word(const Text& lower) {
    return std::any_of(COMMON_WORDS.begin(), COMMON_WORDS.end(),
        [&lower](const char* w) { return contains(lower, w); });
}

SoftScoreResult compute_soft_score(const Text& s, size_t n) {
    SoftScoreResult r;
    r.threshold = length_threshold(n);
    if (n == 0) {
        r.score = entropy_bonus(0.0);
        return r;
    }

    const CharStats st = compute_char_stats(s);
    const double dn = static_cast<double>(n);
    const double digit_ratio = static_cast<double>(st.digits) / dn;
    const double symbol_ratio = static_cast<double>(st.symbols) / dn;
    const double upper_ratio = static_cast<double>(st.upper) / dn;
    const double lower_ratio = static_cast<double>(st.lower) / dn;

    double score = 0.0;
    score += length_bonus(n);
    score += variety_bonus(variety_score(st));
    score += entropy_bonus(shannon_entropy(s));

    if (digit_ratio >= 0.15 && digit_ratio <= 0.6) score += 0.4;
    if (symbol_ratio >= 0.05 && symbol_ratio <= 0.3) score += 0.5;
    if (upper_ratio >= 0.2 && lower_ratio >= 0.2) score += 0.4;
    if (contains_char(s, U'=') && n >= 24) score += 0.3;

    // mostly lowercase prose-like text
    if (lower_ratio > 0.7 && digit_ratio < 0.1 && symbol_ratio < 0.05) score -= 2.0;
    if (looks_like_filename(s)) score -= 1.5;
    if (st.upper == n || st.lower == n) score -= 0.8;
    if (st.symbols == 0 && st.digits == 0) score -= 1.5;

    SecureText lower(to_lower_ascii(s));
    if (contains_common_word(lower.str())) score -= 2.0;

    r.score = score;
    return r;
}

bool soft_score(const Text& s, size_t n) {
    return compute_soft_score(s, n).passes();
}
