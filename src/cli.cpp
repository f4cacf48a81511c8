#include "cli.hpp"

#include <iomanip>
#include <string_view>

// ---------------- Argument parsing ----------------
bool parse_args(int argc, const char* const* argv, Options& opt) {
    bool positional_only = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view a = argv[i];
        if (positional_only) {
            opt.texts.emplace_back(a);
            continue;
        }
        if (a == "--") {
            positional_only = true;
        }
        else if (a == "-h" || a == "--help") {
            opt.show_help = true;
        }
        else if (a == "-v" || a == "--verbose") {
            opt.verbose = true;
        }
        else if (a == "-c" || a == "--clipboard") {
            opt.clipboard = true;
        }
        else if (a == "-f" || a == "--file") {
            if (i + 1 >= argc) {
                std::cerr << "Missing path after " << a << "\n";
                return false;
            }
            opt.files.emplace_back(argv[++i]);
        }
        else if (a.size() > 1 && a[0] == '-') {
            std::cerr << "Unknown option: " << a << "\n";
            return false;
        }
        else {
            opt.texts.emplace_back(a);
        }
    }
    return true;
}

bool reads_stdin(const Options& opt) {
    return opt.texts.empty() && opt.files.empty() && !opt.clipboard;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [-v|--verbose] [-c|--clipboard] [-f|--file PATH] [--] [TEXT...]\n"
        << "\n"
        << "Reports whether each candidate looks like an API key, token or other secret.\n"
        << "With no TEXT, --clipboard or --file, candidates are read from stdin, one per line.\n"
        << "\n"
        << "  -v, --verbose     show fingerprint, deciding stage, length and score\n"
        << "  -c, --clipboard   classify the current clipboard contents\n"
        << "  -f, --file PATH   classify each line of PATH ('-' for stdin)\n"
        << "  -h, --help        show this help\n"
        << "\n"
        << "Exit status: 0 if a secret was found, 1 if none, 2 on error.\n";
}


// ---------------- Report line ----------------
std::string format_report(const Classification& c, const std::string& fp, bool verbose) {
    std::ostringstream line;
    line << (c.verdict ? "secret" : "not-secret");
    if (verbose) {
        line << "\tfp=" << fp
            << "\tstage=" << stage_name(c.stage)
            << "\tlen=" << c.length;
        if (c.scored) {
            line << std::fixed << std::setprecision(2)
                << "\tscore=" << c.score
                << "\tthreshold=" << c.threshold;
        }
    }
    return line.str();
}
