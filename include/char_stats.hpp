#pragma once
#include "keyspot_common.hpp"

// -------- Character statistics --------

// ASCII digit / upper / lower; everything else (incl. non-ASCII) is a symbol.
struct CharStats {
    size_t digits = 0;
    size_t upper = 0;
    size_t lower = 0;
    size_t symbols = 0;

    // number of classes with at least one member (0..4)
    int classes_present() const {
        return (digits > 0) + (upper > 0) + (lower > 0) + (symbols > 0);
    }
};

CharStats compute_char_stats(const Text& s);

// classes_present / 4
double variety_score(const CharStats& st);

// Shannon entropy in bits per character; 0 for empty input.
double shannon_entropy(const Text& s);

// Length of the longest run of one repeated character.
size_t longest_run(const Text& s);
