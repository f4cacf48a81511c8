#pragma once
#include "classifier.hpp"
#include "keyspot_common.hpp"

#include <string>
#include <vector>

// exit codes, grep convention
inline constexpr int EXIT_FOUND = 0;
inline constexpr int EXIT_NONE = 1;
inline constexpr int EXIT_ERROR = 2;

struct Options {
    bool verbose = false;
    bool clipboard = false;
    bool show_help = false;
    std::vector<std::string> files;
    std::vector<std::string> texts;
};

// ---------- Argument parsing ----------
// False on an unknown option or a -f/--file with no path; the reason goes to stderr.
bool parse_args(int argc, const char* const* argv, Options& opt);

// With no TEXT, --clipboard or --file, candidates come from stdin.
bool reads_stdin(const Options& opt);

void print_usage(const char* prog);

// ---------- Report ----------
// "secret" / "not-secret", plus tab-separated fp, stage, len and
// (when soft scored) score and threshold in verbose mode.
std::string format_report(const Classification& c, const std::string& fp, bool verbose);
