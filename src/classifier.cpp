#include "classifier.hpp"
#include "hard_signal.hpp"
#include "quick_reject.hpp"
#include "secure_text.hpp"
#include "soft_score.hpp"
#include "text.hpp"

const char* stage_name(Stage stage) {
    switch (stage) {
    case Stage::TooShort:    return "too_short";
    case Stage::TooLong:     return "too_long";
    case Stage::QuickReject: return "quick_reject";
    case Stage::HardSignal:  return "hard_signal";
    case Stage::SoftScore:   return "soft_score";
    }
    return "unknown";
}

Classification classify(const std::string& raw) {
    Classification c;

    SecureText s(decode_utf8(raw));
    normalize_in_place(s.data());
    const size_t n = s.size();
    c.length = n;

    // ---------------- Length gate ----------------
    if (n < MIN_CANDIDATE_LEN) {
        c.stage = Stage::TooShort;
        return c;
    }
    if (n > MAX_CANDIDATE_LEN) {
        c.stage = Stage::TooLong;
        return c;
    }

    // ---------------- Stage 0: quick rejects ----------------
    if (quick_reject(s.str(), n)) {
        c.stage = Stage::QuickReject;
        return c;
    }

    // ---------------- Stage 1: hard signals ----------------
    switch (hard_signal(s.str(), n)) {
    case HardSignal::Positive:
        c.stage = Stage::HardSignal;
        c.verdict = true;
        return c;
    case HardSignal::Negative:
        c.stage = Stage::HardSignal;
        c.verdict = false;
        return c;
    case HardSignal::Undecided:
        break;
    }

    // ---------------- Stage 2: soft scoring ----------------
    SoftScoreResult r = compute_soft_score(s.str(), n);
    c.stage = Stage::SoftScore;
    c.scored = true;
    c.score = r.score;
    c.threshold = r.threshold;
    c.verdict = r.passes();
    return c;
}

bool is_likely_secret(const std::string& raw) {
    return classify(raw).verdict;
}
