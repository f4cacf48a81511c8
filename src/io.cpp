#include "io.hpp"
#include "util.hpp"
#include "logging.hpp"

#include <fstream>

// -------- Global paths --------
std::string g_config_dir;
std::string g_audit_log_path;

// ---------- Path helpers ----------
static std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
#if !defined(_WIN32)
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
#endif
    if (!home || !*home) return ".";
    return std::string(home);
}

static bool ensure_dir_exists(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << path << " exists but is not a directory\n";
            return false;
        }
        if ((st.st_mode & 0777) != mode) {
            if (chmod(path.c_str(), mode) != 0) {
                std::cerr << "Failed to set permissions on " << path << ": " << strerror(errno) << "\n";
                return false;
            }
        }
        return true;
    }
    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST) {
            std::cerr << "Failed to create directory " << path << ": " << strerror(errno) << "\n";
            return false;
        }
    }
    return true;
}

// -------- Ownership and permission checks ----------
bool check_dir_ownership_and_perms(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        std::cerr << "Internal error: config directory check failed.\n";
        return false;
    }
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::ERROR,
            "Directory ownership violation: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: config directory access check failed.\n";
        return false;
    }
    // No group/other access allowed
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure directory permissions on: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: config directory access check failed.\n";
        return false;
    }
    return true;
}

bool check_file_ownership_and_perms(const std::string& path, bool allow_missing) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT && allow_missing) return true;
        std::cerr << "Internal error: file check failed for " << path << ".\n";
        return false;
    }
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::ERROR,
            "File ownership violation: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: file access check failed.\n";
        return false;
    }
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure file permissions on: " + path,
            "io_module",
            "failure");
        std::cerr << "Internal error: file access check failed.\n";
        return false;
    }
    return true;
}


// ---------- Config directory initialization ----------
bool init_config_paths() {
    const char* override_dir = std::getenv(HOME_ENV_OVERRIDE);
    if (override_dir && *override_dir) {
        g_config_dir = override_dir;
    }
    else {
        g_config_dir = get_user_home_dir() + "/" + CONFIG_DIRNAME;
    }

    if (!ensure_dir_exists(g_config_dir, S_IRWXU)) {
        return false;
    }
    if (!check_dir_ownership_and_perms(g_config_dir)) {
        return false;
    }

    g_audit_log_path = g_config_dir + "/" + AUDIT_LOG;
    return check_file_ownership_and_perms(g_audit_log_path, true);
}


// ---------- Candidate input ----------
bool read_candidate_lines(std::istream& in, std::vector<std::string>& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.size() > MAX_LINE_BYTES) {
            wipe_string(line);
            audit_log_level(LogLevel::WARN,
                "Input line exceeded limit and was dropped",
                "io_module",
                "dropped");
            out.emplace_back();
            continue;
        }
        out.push_back(line);
        wipe_string(line);
    }
    wipe_string(line);
    return !in.bad();
}

bool read_candidate_file(const std::string& path, std::vector<std::string>& out) {
    if (path == "-") {
        return read_candidate_lines(std::cin, out);
    }

    std::ifstream f(path);
    if (!f) {
        audit_log_level(LogLevel::ERROR,
            "Cannot open input file: " + path,
            "io_module",
            "failure");
        return false;
    }
    bool ok = read_candidate_lines(f, out);
    if (!ok) {
        audit_log_level(LogLevel::ERROR,
            "Read error on input file: " + path,
            "io_module",
            "failure");
    }
    return ok;
}
