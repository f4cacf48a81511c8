#include "text.hpp"


// ---------------- UTF-8 decoding ----------------
Text decode_utf8(const std::string& raw) {
    Text out;
    out.reserve(raw.size());

    const size_t len = raw.size();
    size_t i = 0;
    while (i < len) {
        const unsigned char b0 = static_cast<unsigned char>(raw[i]);
        if (b0 < 0x80) {
            out.push_back(static_cast<char32_t>(b0));
            ++i;
            continue;
        }

        size_t need = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;
        if ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; min_cp = 0x80; }
        else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; min_cp = 0x800; }
        else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; min_cp = 0x10000; }
        else {
            // stray continuation byte or invalid lead
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        // truncated at end of input
        if (i + need >= len) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        bool ok = true;
        for (size_t k = 1; k <= need; ++k) {
            const unsigned char bk = static_cast<unsigned char>(raw[i + k]);
            if ((bk & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (bk & 0x3F);
        }

        // overlong, surrogate or out of range
        if (!ok || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += need + 1;
    }
    return out;
}


// ---------------- Character classes ----------------
bool is_unicode_space(char32_t c) {
    switch (c) {
    case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
    case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}


// ---------------- Text helpers ----------------

// Shift [first, last) to the front and wipe what falls off the end.
static void keep_range(Text& s, size_t first, size_t last) {
    const size_t kept = last - first;
    if (first > 0) {
        std::copy(s.begin() + static_cast<std::ptrdiff_t>(first),
            s.begin() + static_cast<std::ptrdiff_t>(last), s.begin());
    }
    if (kept < s.size()) {
        sodium_memzero(&s[kept], (s.size() - kept) * sizeof(char32_t));
        s.resize(kept);
    }
}

void trim_in_place(Text& s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && is_unicode_space(s[first])) ++first;
    while (last > first && is_unicode_space(s[last - 1])) --last;
    keep_range(s, first, last);
}

Text trim(const Text& s) {
    Text r = s;
    trim_in_place(r);
    return r;
}

Text to_lower_ascii(const Text& s) {
    Text r = s;
    for (char32_t& c : r) {
        if (is_ascii_upper(c)) c = c - U'A' + U'a';
    }
    return r;
}

static bool ascii_eq(char32_t a, char b) {
    return a == static_cast<char32_t>(static_cast<unsigned char>(b));
}

bool contains(const Text& s, std::string_view needle) {
    if (needle.empty()) return true;
    return std::search(s.begin(), s.end(), needle.begin(), needle.end(), ascii_eq) != s.end();
}

bool starts_with(const Text& s, std::string_view prefix) {
    if (prefix.size() > s.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(),
        [](char b, char32_t a) { return ascii_eq(a, b); });
}

bool ends_with(const Text& s, std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return std::equal(suffix.begin(), suffix.end(), s.end() - static_cast<std::ptrdiff_t>(suffix.size()),
        [](char b, char32_t a) { return ascii_eq(a, b); });
}

bool contains_char(const Text& s, char32_t c) {
    return s.find(c) != Text::npos;
}

size_t count_char(const Text& s, char32_t c) {
    return static_cast<size_t>(std::count(s.begin(), s.end(), c));
}


// ---------------- Normalizer ----------------
static bool wrapped_in(const Text& t, char32_t q) {
    return t.size() > 2 && t.front() == q && t.back() == q;
}

void normalize_in_place(Text& t) {
    trim_in_place(t);
    if (wrapped_in(t, U'"') || wrapped_in(t, U'\'')) {
        keep_range(t, 1, t.size() - 1);
        trim_in_place(t);
    }
}

Text normalize(const Text& raw) {
    Text t = raw;
    normalize_in_place(t);
    return t;
}
