#include "char_stats.hpp"
#include "secure_text.hpp"
#include "text.hpp"

#include <cmath>

CharStats compute_char_stats(const Text& s) {
    CharStats st;
    for (char32_t c : s) {
        if (is_ascii_digit(c)) st.digits++;
        else if (is_ascii_upper(c)) st.upper++;
        else if (is_ascii_lower(c)) st.lower++;
        else st.symbols++;
    }
    return st;
}

double variety_score(const CharStats& st) {
    return static_cast<double>(st.classes_present()) / 4.0;
}

double shannon_entropy(const Text& s) {
    if (s.empty()) {
        return 0.0;
    }

    // frequencies are run lengths over a sorted copy that is wiped on return
    SecureText sorted{Text(s)};
    Text& t = sorted.data();
    std::sort(t.begin(), t.end());

    const double n = static_cast<double>(t.size());
    double entropy = 0.0;
    size_t i = 0;
    while (i < t.size()) {
        size_t j = i + 1;
        while (j < t.size() && t[j] == t[i]) ++j;
        double p = static_cast<double>(j - i) / n;
        entropy -= p * std::log2(p);
        i = j;
    }
    return entropy;
}

size_t longest_run(const Text& s) {
    if (s.empty()) return 0;

    size_t run = 1;
    size_t best = 1;
    for (size_t i = 1; i < s.size(); ++i) {
        if (s[i] == s[i - 1]) {
            run++;
            best = std::max(best, run);
        }
        else {
            run = 1;
        }
    }
    return best;
}
