#include "clipboard.hpp"
#include "logging.hpp"
#include "util.hpp"

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

// ---------------- Clipboard reader helper ----------------
#if !defined(_WIN32)
static bool run_reader_to_string(const std::vector<const char*>& argv, // !WIN32
    std::string& out)
{
    int pipefd[2];
    if (pipe(pipefd) != 0) return false;

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        // child: stdout -> pipe write end
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (auto p : argv) args.push_back(const_cast<char*>(p));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127);
    }

    // parent: read from pipe
    close(pipefd[1]);
    std::string s;
    char buf[4096];
    ssize_t r;

    while ((r = read(pipefd[0], buf, sizeof(buf))) > 0) {
        if (s.size() + static_cast<size_t>(r) > MAX_CLIPBOARD_BYTES) {
            // keep the head, discard the rest
            s.append(buf, buf + (MAX_CLIPBOARD_BYTES - s.size()));
            break;
        }
        s.append(buf, buf + r);
    }
    sodium_memzero(buf, sizeof(buf));
    close(pipefd[0]);

    int status = 0;
    waitpid(pid, &status, 0);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        wipe_string(s);
        return false;
    }

    // trim trailing newlines
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }

    out = std::move(s);
    return true;
}
#endif


// ---------------- Platform detection for WSL ----------------
bool running_in_wsl() {
    FILE* f = fopen("/proc/version", "r");
    if (!f) return false;

    char buf[256];
    size_t nread = fread(buf, 1, sizeof(buf) - 1, f);
    fclose(f);

    if (nread == 0) {
        return false;
    }

    buf[nread] = '\0';

    return (strstr(buf, "Microsoft") || strstr(buf, "WSL"));
}


// ---------------- Clipboard read ----------------
bool clipboard_get(std::string& out) {
#if defined(_WIN32)
    if (!OpenClipboard(nullptr)) {
        audit_log_level(LogLevel::WARN,
            "clipboard_get: OpenClipboard failed",
            "clipboard_module",
            "failure");
        return false;
    }
    HANDLE h = GetClipboardData(CF_TEXT);
    if (!h) {
        CloseClipboard();
        return false;
    }
    const char* src = static_cast<const char*>(GlobalLock(h));
    if (!src) {
        CloseClipboard();
        return false;
    }

    out.assign(src, strnlen(src, MAX_CLIPBOARD_BYTES));
    GlobalUnlock(h);
    CloseClipboard();
    return true;
#else
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    const char* x11 = std::getenv("DISPLAY");
    std::vector<const char*> cmd;
    if (wayland && *wayland) {
        cmd = { "wl-paste", "--no-newline" };
    }
    else if ((!x11 || !*x11) && running_in_wsl()) {
        cmd = { "powershell.exe", "-NoProfile", "-Command", "Get-Clipboard" };
    }
    else {
        cmd = { "xclip", "-selection", "clipboard", "-o" };
    }

    std::string tmp;
    if (!run_reader_to_string(cmd, tmp)) {
        audit_log_level(LogLevel::WARN,
            std::string("clipboard_get: external tool failed: ") + cmd[0],
            "clipboard_module",
            "failure");
        return false;
    }
    out = std::move(tmp);
    return true;
#endif
}
