#pragma once
#include "keyspot_common.hpp"
#include "logging.hpp"

#include <string>

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Hex ----------
std::string to_hex(const byte* data, size_t len);

// ---------- Candidate fingerprint ----------
// Short BLAKE2b digest used to refer to a candidate without logging it.
std::string candidate_fingerprint(const std::string& candidate);

// ---------- Memory cleanup ----------
void wipe_string(std::string& s);
void wipe_strings(std::vector<std::string>& v);
