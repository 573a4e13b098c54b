#include "txcopy/process.h"
#include "txcopy/error.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace txcopy {
namespace process {

namespace {

/// RAII guard for a raw file descriptor.
struct FdGuard {
    int fd;
    explicit FdGuard(int f = -1) : fd(f) {}
    ~FdGuard() { reset(); }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

[[noreturn]] void throw_errno(const std::string& ctx) {
    throw ProcessError(ctx + ": " + std::strerror(errno));
}

/// Child side: wire up stdio, exec, report exec failure through `err_fd`.
/// Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(char* const* argv, int out_fd, int err_fd) {
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::close(null_fd);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(out_fd, STDERR_FILENO);
    ::close(out_fd);

    ::execvp(argv[0], argv);

    int e = errno;
    ssize_t n = ::write(err_fd, &e, sizeof(e));
    (void)n;
    ::_exit(127);
}

} // anonymous namespace

ProcessResult run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw ProcessError("empty command line");
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) throw_errno("pipe");
    FdGuard out_read(out_pipe[0]), out_write(out_pipe[1]);

    // Closed by a successful exec (O_CLOEXEC); carries errno otherwise.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) throw_errno("pipe");
    FdGuard err_read(err_pipe[0]), err_write(err_pipe[1]);

    pid_t pid = ::fork();
    if (pid < 0) throw_errno("fork");
    if (pid == 0) {
        exec_child(cargv.data(), out_write.fd, err_write.fd);
    }

    out_write.reset();
    err_write.reset();

    ProcessResult result;

    char buf[4096];
    while (true) {
        ssize_t n = ::read(out_read.fd, buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    int child_errno = 0;
    ssize_t got;
    do {
        got = ::read(err_read.fd, &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw_errno("waitpid");
    }

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        result.status = -1;
        result.exec_errno = child_errno;
    } else {
        result.status = status;
    }
    return result;
}

std::string explain(const ProcessResult& result) {
    if (result.status == -1) {
        return std::string("failed to execute: ") +
               std::strerror(result.exec_errno);
    }
    if (WIFSIGNALED(result.status)) {
        int sig = WTERMSIG(result.status);
        std::string out = "died with signal " + std::to_string(sig);
        const char* name = ::strsignal(sig);
        if (name) { out += " ("; out += name; out += ")"; }
#ifdef WCOREDUMP
        if (WCOREDUMP(result.status)) out += ", core dumped";
#endif
        return out;
    }
    if (WIFEXITED(result.status)) {
        int code = WEXITSTATUS(result.status);
        if (code == 0) return "exited successfully";
        return "exited with code " + std::to_string(code);
    }
    return "ended with wait status " + std::to_string(result.status);
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out += ' ';
        const auto& a = argv[i];
        bool plain = !a.empty() && std::all_of(a.begin(), a.end(), [](unsigned char c) {
            return std::isalnum(c) || (c != 0 && std::strchr("@%+=:,./_-", c) != nullptr);
        });
        if (!plain) {
            out += '\'';
            for (char c : a) {
                if (c == '\'') out += "'\\''";
                else out += c;
            }
            out += '\'';
        } else {
            out += a;
        }
    }
    return out;
}

} // namespace process
} // namespace txcopy
