#include "hard_signal.hpp"
#include "secure_text.hpp"
#include "text.hpp"

#include <array>

static constexpr std::array<KnownPrefix, 23> KNOWN_PREFIXES = { {
    { "AKIA", 20 },        // AWS access key id
    { "ASIA", 20 },        // AWS temporary key id
    { "sk_live_", 32 },    // Stripe
    { "sk_test_", 32 },
    { "pk_live_", 32 },
    { "pk_test_", 32 },
    { "rk_live_", 0 },
    { "rk_test_", 0 },
    { "xoxb-", 50 },       // Slack
    { "xoxp-", 50 },
    { "xoxa-", 0 },
    { "xoxr-", 0 },
    { "ghp_", 40 },        // GitHub
    { "gho_", 40 },
    { "ghu_", 40 },
    { "ghs_", 40 },
    { "ghr_", 0 },
    { "github_pat_", 82 },
    { "AIza", 39 },        // Google API key
    { "ya29.", 0 },        // Google OAuth access token
    { "glpat-", 0 },       // GitLab
    { "gloas-", 0 },
    { "glsa-", 0 },
} };

static constexpr std::array<const char*, 13> SECRET_DOMAINS = {
    ".apps.googleusercontent.com",
    ".firebaseapp.com",
    ".amazoncognito.com",
    ".onmicrosoft.com",
    ".azurewebsites.net",
    ".cloudapp.azure.com",
    ".supabase.co",
    ".vercel.app",
    ".netlify.app",
    ".herokuapp.com",
    ".awsapps.com",
    ".okta.com",
    ".auth0.com",
};


// ---------------- Known prefixes ----------------
bool has_known_prefix(const Text& s) {
    return std::any_of(KNOWN_PREFIXES.begin(), KNOWN_PREFIXES.end(),
        [&s](const KnownPrefix& p) { return starts_with(s, p.prefix); });
}

bool known_prefix_satisfied(const Text& s, size_t n) {
    if (!has_known_prefix(s)) return false;

    for (const KnownPrefix& p : KNOWN_PREFIXES) {
        if (p.min_length != 0 && starts_with(s, p.prefix) && n >= p.min_length) {
            return true;
        }
    }
    return n >= GENERIC_PREFIX_MIN_LEN;
}


// ---------------- Structural shapes ----------------
bool looks_like_jwt(const Text& s) {
    // split on '.', keeping empty segments
    size_t segments = 0;
    size_t start = 0;
    while (true) {
        size_t dot = s.find(U'.', start);
        size_t end = (dot == Text::npos) ? s.size() : dot;

        if (end - start < JWT_MIN_SEGMENT_LEN) return false;
        for (size_t i = start; i < end; ++i) {
            if (!is_base64url_char(s[i])) return false;
        }
        if (++segments > 3) return false;

        if (dot == Text::npos) break;
        start = dot + 1;
    }
    return segments == 3;
}

bool looks_like_hex_blob(const Text& s, size_t n) {
    if (n < HEX_MIN_LEN || n > HEX_MAX_LEN) return false;
    return std::all_of(s.begin(), s.end(), is_hex_digit);
}

bool looks_like_base64_blob(const Text& s, size_t n) {
    if (n < BASE64_MIN_LEN || n % 4 != 0) return false;
    if (!std::all_of(s.begin(), s.end(), is_base64_char)) return false;

    bool has_digit = std::any_of(s.begin(), s.end(), is_ascii_digit);
    bool has_symbol = contains_char(s, U'+') || contains_char(s, U'/') || contains_char(s, U'=');
    return has_digit || has_symbol;
}

bool contains_secret_domain(const Text& lower) {
    return std::any_of(SECRET_DOMAINS.begin(), SECRET_DOMAINS.end(),
        [&lower](const char* d) { return contains(lower, d); });
}


// ---------------- Hard-signal stage ----------------
HardSignal hard_signal(const Text& s, size_t n) {
    if (known_prefix_satisfied(s, n)) return HardSignal::Positive;
    if (n >= JWT_MIN_LEN && looks_like_jwt(s)) return HardSignal::Positive;
    if (looks_like_hex_blob(s, n)) return HardSignal::Positive;
    if (looks_like_base64_blob(s, n)) return HardSignal::Positive;

    SecureText lower(to_lower_ascii(s));
    if (contains_secret_domain(lower.str())) return HardSignal::Positive;

    return HardSignal::Undecided;
}
