#pragma once
#include "keyspot_common.hpp"

// -------- Soft scorer --------

struct SoftScoreResult {
    double score = 0.0;
    double threshold = 0.0;

    bool passes() const { return score >= threshold; }
};

// Highest qualifying length bucket: 40 / 32 / 24 / 16 characters.
double length_bonus(size_t n);

// 2.0 from 32 characters, 2.5 from 20, 3.0 below.
double length_threshold(size_t n);

// text after the last '.' is 2-5 ASCII letters
bool looks_like_filename(const Text& s);

// `lower` must already be lowercased
bool contains_common_word(const Text& lower);

SoftScoreResult compute_soft_score(const Text& s, size_t n);

bool soft_score(const Text& s, size_t n);
