#include "platform/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

constexpr size_t kMaxStderrTail = 2048;

std::string trim_tail(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    if (s.size() > kMaxStderrTail) s.erase(0, s.size() - kMaxStderrTail);
    return s;
}

} // namespace

std::expected<void, std::string> run_process(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("run_process: empty command line");
    }

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: inherit default signal disposition, route stderr into the pipe.
        sigset_t all;
        sigemptyset(&all);
        ::sigprocmask(SIG_SETMASK, &all, nullptr);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    std::string child_stderr;
    char buf[512];
    for (;;) {
        ssize_t n = ::read(err_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            child_stderr.append(buf, static_cast<size_t>(n));
            if (child_stderr.size() > 4 * kMaxStderrTail) {
                child_stderr.erase(0, child_stderr.size() - kMaxStderrTail);
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    ::close(err_pipe[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected(argv[0] + " could not be executed");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        auto tail = trim_tail(std::move(child_stderr));
        auto msg = std::format("{} exited with code {}", argv[0], WEXITSTATUS(status));
        if (!tail.empty()) msg += ": " + tail;
        return std::unexpected(std::move(msg));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(std::format("{} killed by signal {}", argv[0], WTERMSIG(status)));
    }

    return {};
}

} // namespace platform
