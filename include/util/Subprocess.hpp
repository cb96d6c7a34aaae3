#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lc::util {

struct ProcessResult {
    int exitCode{-1};           // 128 + signal number when killed by a signal
    bool timedOut{false};
    std::string stderrOutput;

    [[nodiscard]] bool ok() const { return !timedOut && exitCode == 0; }
};

class Subprocess {
public:
    // argv[0] is resolved through PATH. stdout goes to /dev/null; stdin is
    // stdinPath when given, /dev/null otherwise. The child is killed once
    // timeout elapses.
    static ProcessResult run(const std::vector<std::string>& argv,
                             const std::optional<std::filesystem::path>& stdinPath,
                             std::chrono::milliseconds timeout);
};

// POSIX shell single-quoting for arguments interpreted by a remote shell
std::string shellQuote(const std::string& arg);

}
