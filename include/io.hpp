#pragma once
#include "keyspot_common.hpp"
#include "logging.hpp"

// -------- Global paths --------
extern std::string g_config_dir;
extern std::string g_audit_log_path;

// Resolve ~/.keyspot (or $KEYSPOT_HOME), create it 0700 and check that
// it and the audit log are owned by us with no group/other access.
bool init_config_paths();

bool check_dir_ownership_and_perms(const std::string& path);
bool check_file_ownership_and_perms(const std::string& path, bool allow_missing);

// -------- Candidate input --------

// One candidate per line; CR stripped. A line longer than MAX_LINE_BYTES is
// kept as an empty candidate so positions still line up.
// Returns false on a read error.
bool read_candidate_lines(std::istream& in, std::vector<std::string>& out);

// "-" reads stdin
bool read_candidate_file(const std::string& path, std::vector<std::string>& out);
