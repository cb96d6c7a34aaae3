#include "util/Subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace lc::util;

namespace {

constexpr size_t MAX_CAPTURED_STDERR = 64 * 1024;

int decodeStatus(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ProcessResult Subprocess::run(const std::vector<std::string>& argv,
                              const std::optional<std::filesystem::path>& stdinPath,
                              const std::chrono::milliseconds timeout) {
    if (argv.empty()) throw std::invalid_argument("Subprocess::run requires a program name");

    // Everything the child touches is prepared before fork()
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    const std::string stdinStr = stdinPath ? stdinPath->string() : "/dev/null";

    int errPipe[2];
    if (pipe2(errPipe, O_CLOEXEC) == -1)
        throw std::runtime_error(fmt::format("Failed to create stderr pipe for {}: {}", argv[0], std::strerror(errno)));

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(errPipe[0]);
        close(errPipe[1]);
        throw std::runtime_error(fmt::format("Failed to fork {}: {}", argv[0], std::strerror(err)));
    }

    if (pid == 0) {
        const int in = open(stdinStr.c_str(), O_RDONLY);
        const int devNull = open("/dev/null", O_WRONLY);
        if (in < 0 || devNull < 0) _exit(126);
        dup2(in, STDIN_FILENO);
        dup2(devNull, STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        const char msg[] = "exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    close(errPipe[1]);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];

    for (;;) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            kill(pid, SIGKILL);
            break;
        }

        pollfd pfd{errPipe[0], POLLIN, 0};
        const int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (rc < 0) {
            const int err = errno;
            if (err == EINTR) continue;
            kill(pid, SIGKILL);
            close(errPipe[0]);
            waitpid(pid, nullptr, 0);
            throw std::runtime_error(fmt::format("poll() failed while waiting for {}: {}", argv[0], std::strerror(err)));
        }
        if (rc == 0) continue;

        const ssize_t n = read(errPipe[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break; // EOF: child closed stderr (normally by exiting)
        if (result.stderrOutput.size() < MAX_CAPTURED_STDERR)
            result.stderrOutput.append(buf, static_cast<size_t>(n));
    }

    close(errPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid() failed for {}: {}", argv[0], std::strerror(errno)));
    }
    result.exitCode = decodeStatus(status);
    return result;
}

std::string lc::util::shellQuote(const std::string& arg) {
    std::string out = "'";
    for (const char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}
