#include "logging.hpp"
#include "io.hpp"
#include "util.hpp"

LogContext g_log_ctx;


// ---------------- Get username ----------------
static std::string get_system_username() {
#if defined(_WIN32)
    char buf[256];
    DWORD len = static_cast<DWORD>(sizeof(buf));
    if (GetUserNameA(buf, &len)) {
        return std::string(buf);
    }
    const char* envUser = std::getenv("USERNAME");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
#else
    uid_t uid = geteuid();
    struct passwd* pw = getpwuid(uid);
    if (pw && pw->pw_name) {
        return std::string(pw->pw_name);
    }
    const char* envUser = std::getenv("USER");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
#endif
}


// ---------------- Get host name ----------------
static std::string get_host_name() {
#if defined(_WIN32)
    const char* envHost = std::getenv("COMPUTERNAME");
    if (envHost && *envHost) {
        return std::string(envHost);
    }
    return "localhost";
#else
    char buf[256];
    if (gethostname(buf, sizeof(buf)) == 0) {
        buf[sizeof(buf) - 1] = '\0';
        if (buf[0]) return std::string(buf);
    }
    return "localhost";
#endif
}


// ---------------- Global logging context init ----------------
void init_log_context() {
    g_log_ctx.userId = get_system_username();
    g_log_ctx.host = get_host_name();
    g_log_ctx.sessionId = generate_session_id();
}


// ---------------- Logging (levels) ----------------
const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    // determine log path
    const char* path = (!g_audit_log_path.empty()
        ? g_audit_log_path.c_str()
        : AUDIT_LOG);

    FILE* f = std::fopen(path, "a");
    if (!f) {
        std::fprintf(stderr, "[audit-fail] %s: %s\n",
            log_level_str(lvl),
            entry.c_str());
        return;
    }

#if !defined(_WIN32)
    if (fchmod(fileno(f), S_IRUSR | S_IWUSR) != 0) {
        std::fprintf(stderr, "[audit-warn] cannot restrict permissions on %s\n", path);
    }
#endif

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // one entry per line
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);

    // timestamp | level | user | host | session | event | outcome | message
    std::fprintf(
        f,
        "%s | %s | user=%s | host=%s | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        g_log_ctx.userId.c_str(),
        g_log_ctx.host.c_str(),
        g_log_ctx.sessionId.c_str(),
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(f);
    std::fclose(f);
}
