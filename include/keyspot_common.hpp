#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <sys/types.h>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#include <pwd.h>
#endif

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstddef>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <ctime>
#include <cerrno>
#include <algorithm>

// -------- Configuration constants --------
inline constexpr const char* CONFIG_DIRNAME = ".keyspot";
inline constexpr const char* AUDIT_LOG = "audit.log";
inline constexpr const char* HOME_ENV_OVERRIDE = "KEYSPOT_HOME";

// classifier length gate, counted in Unicode scalar values
inline constexpr size_t MIN_CANDIDATE_LEN = 10;
inline constexpr size_t MAX_CANDIDATE_LEN = 256;

// clipboard / input line read caps (bytes)
inline constexpr size_t MAX_CLIPBOARD_BYTES = 1024 * 1024;
inline constexpr size_t MAX_LINE_BYTES = 64 * 1024;

// BLAKE2b fingerprint used to refer to candidates in logs
inline constexpr size_t FINGERPRINT_LEN = crypto_generichash_BYTES_MIN;

using byte = unsigned char;

// Decoded candidate text: one element per Unicode scalar value.
using Text = std::u32string;
