#pragma once
#include "keyspot_common.hpp"

// -------- Secret-likelihood classifier --------
//
// Pure and re-entrant: no I/O, no shared mutable state. Input is UTF-8;
// lengths are counted in Unicode scalar values after normalization.

// Pipeline stage that produced the verdict.
enum class Stage { TooShort, TooLong, QuickReject, HardSignal, SoftScore };

struct Classification {
    bool verdict = false;
    Stage stage = Stage::TooShort;
    size_t length = 0;       // normalized length
    bool scored = false;     // score/threshold valid only if the soft scorer ran
    double score = 0.0;
    double threshold = 0.0;
};

// Stable lowercase identifier, e.g. "quick_reject".
const char* stage_name(Stage stage);

Classification classify(const std::string& raw);

bool is_likely_secret(const std::string& raw);
