#include "classifier.hpp"
#include "cli.hpp"
#include "clipboard.hpp"
#include "keyspot_common.hpp"
#include "logging.hpp"
#include "io.hpp"
#include "util.hpp"

// ---------------- Per-candidate report ----------------
static bool report(const std::string& source, const std::string& candidate, bool verbose) {
    const Classification c = classify(candidate);
    const std::string fp = candidate_fingerprint(candidate);
    std::cout << format_report(c, fp, verbose) << "\n";

    audit_log_level(c.verdict ? LogLevel::ALERT : LogLevel::INFO,
        "Candidate from " + source + " fp=" + fp + " stage=" + stage_name(c.stage),
        "classify",
        c.verdict ? "secret" : "not_secret");
    return c.verdict;
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        print_usage(argv[0]);
        return EXIT_ERROR;
    }
    if (opt.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (sodium_init() < 0) {
        std::fprintf(stderr, "An unexpected error occurred: libsodium initialization failed.\n");
        return EXIT_ERROR;
    }
    init_log_context();
    if (!init_config_paths()) {
        std::fprintf(stderr, "Failed to initialize configuration directory.\n");
        audit_log_level(LogLevel::ERROR,
            "Config path initialization failed",
            "session",
            "failure");
        return EXIT_ERROR;
    }
    audit_log_level(LogLevel::INFO,
        "keyspot starting",
        "session",
        "notify");

    bool found = false;
    bool io_error = false;
    const bool read_stdin = reads_stdin(opt);

    for (auto& t : opt.texts) {
        found = report("argv", t, opt.verbose) || found;
    }
    wipe_strings(opt.texts);

    if (opt.clipboard) {
        std::string clip;
        if (clipboard_get(clip)) {
            found = report("clipboard", clip, opt.verbose) || found;
            wipe_string(clip);
        }
        else {
            std::cerr << "Could not read the clipboard. Check audit log.\n";
            io_error = true;
        }
    }

    std::vector<std::string> files = opt.files;
    if (read_stdin) {
        files.push_back("-");
    }

    for (const auto& path : files) {
        std::vector<std::string> lines;
        if (!read_candidate_file(path, lines)) {
            std::cerr << "Could not read " << path << ". Check audit log.\n";
            io_error = true;
            wipe_strings(lines);
            continue;
        }
        const std::string source = (path == "-") ? "stdin" : path;
        for (const auto& l : lines) {
            found = report(source, l, opt.verbose) || found;
        }
        wipe_strings(lines);
    }

    audit_log_level(LogLevel::INFO,
        std::string("Session closed, secret ") + (found ? "found" : "not found"),
        "session",
        io_error ? "failure" : "success");

    if (io_error) return EXIT_ERROR;
    return found ? EXIT_FOUND : EXIT_NONE;
}
