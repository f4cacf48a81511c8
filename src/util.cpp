#include "util.hpp"

#include <array>


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());
    return to_hex(buf.data(), buf.size());
}


// ---------- Hex ----------
std::string to_hex(const byte* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(2 * len);

    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = hex[(data[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[data[i] & 0x0F];
    }
    return out;
}


// ---------- Candidate fingerprint ----------
std::string candidate_fingerprint(const std::string& candidate) {
    std::array<byte, FINGERPRINT_LEN> digest{};
    if (crypto_generichash(digest.data(), digest.size(),
        reinterpret_cast<const byte*>(candidate.data()), candidate.size(),
        nullptr, 0) != 0) {
        return "unavailable";
    }
    return to_hex(digest.data(), digest.size());
}


// ---------- Memory cleanup ----------
void wipe_string(std::string& s) {
    if (!s.empty()) {
        sodium_memzero(&s[0], s.size());
    }
    s.clear();
}

void wipe_strings(std::vector<std::string>& v) {
    for (auto& s : v) {
        wipe_string(s);
    }
    v.clear();
}
