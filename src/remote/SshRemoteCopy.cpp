#include "remote/SshRemoteCopy.hpp"
#include "util/Subprocess.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>

using namespace lc::remote;
using namespace lc::util;
using namespace lc::log;
using lc::pipeline::TransferError;

namespace {

constexpr int SSH_ERROR_EXIT = 255;

constexpr std::array AUTH_MARKERS = {
    "Permission denied",
    "Host key verification failed",
    "REMOTE HOST IDENTIFICATION HAS CHANGED",
    "No supported authentication methods",
    "Too many authentication failures",
};

std::string lastLine(const std::string& text) {
    const auto end = text.find_last_not_of(" \r\n\t");
    if (end == std::string::npos) return {};
    const auto nl = text.rfind('\n', end);
    const auto begin = nl == std::string::npos ? 0 : nl + 1;
    return text.substr(begin, end - begin + 1);
}

}

SshRemoteCopy::SshRemoteCopy(SshTarget target, const std::chrono::milliseconds commandTimeout)
    : target_(std::move(target)), commandTimeout_(commandTimeout) {
    if (target_.host.empty()) throw std::invalid_argument("SshRemoteCopy requires a host");
    if (target_.user.empty()) throw std::invalid_argument("SshRemoteCopy requires a user");
}

std::vector<std::string> SshRemoteCopy::buildCommand(const std::string& remoteCommand) const {
    const auto connectSecs = std::max<long long>(
        1, std::chrono::duration_cast<std::chrono::seconds>(target_.connectTimeout).count());

    std::vector<std::string> argv = {
        "ssh",
        "-o", "BatchMode=yes",
        "-o", fmt::format("ConnectTimeout={}", connectSecs),
        // Never join or spawn a shared master connection
        "-o", "ControlMaster=no",
        "-o", "ControlPath=none",
    };

    if (target_.port != 22) {
        argv.emplace_back("-p");
        argv.emplace_back(std::to_string(target_.port));
    }

    if (!target_.identityFile.empty()) {
        argv.emplace_back("-i");
        argv.emplace_back(target_.identityFile);
    }

    argv.emplace_back(fmt::format("{}@{}", target_.user, target_.host));
    argv.emplace_back(remoteCommand);
    return argv;
}

std::optional<TransferError> SshRemoteCopy::classify(const ProcessResult& result,
                                                     const std::string& action,
                                                     const std::string& host) {
    if (result.ok()) return std::nullopt;

    const auto detail = lastLine(result.stderrOutput);

    if (result.timedOut)
        return TransferError::network(fmt::format("{} on {} timed out", action, host));

    if (result.exitCode == SSH_ERROR_EXIT) {
        const bool authFailure = std::ranges::any_of(AUTH_MARKERS, [&](const char* marker) {
            return result.stderrOutput.find(marker) != std::string::npos;
        });

        if (authFailure)
            return TransferError::auth(fmt::format(
                "{} on {}: authentication failed ({}); check the ssh key and known_hosts entry for this host",
                action, host, detail));

        return TransferError::network(fmt::format("{} on {}: ssh connection failed ({})", action, host, detail));
    }

    return TransferError::remoteIO(fmt::format("{} on {} exited with status {} ({})",
                                               action, host, result.exitCode, detail));
}

ProcessResult SshRemoteCopy::runRemote(const std::string& remoteCommand,
                                       const std::optional<std::filesystem::path>& stdinPath) const {
    Registry::transfer()->debug("[SshRemoteCopy] {}@{}: {}", target_.user, target_.host, remoteCommand);
    try {
        return Subprocess::run(buildCommand(remoteCommand), stdinPath, commandTimeout_);
    } catch (const std::runtime_error& e) {
        throw TransferError::remoteIO(fmt::format("unable to run ssh for {}: {}", target_.host, e.what()));
    }
}

void SshRemoteCopy::runOrThrow(const std::string& remoteCommand, const std::string& action,
                               const std::optional<std::filesystem::path>& stdinPath) const {
    const auto result = runRemote(remoteCommand, stdinPath);
    if (auto err = classify(result, action, target_.host)) throw *err;
}

void SshRemoteCopy::copy(const std::filesystem::path& localPath, const std::string& remotePath) {
    runOrThrow("cat > " + shellQuote(remotePath), fmt::format("copy to {}", remotePath), localPath);
}

void SshRemoteCopy::makeDirectories(const std::string& remoteDir) {
    runOrThrow("mkdir -p -- " + shellQuote(remoteDir), fmt::format("mkdir {}", remoteDir));
}

bool SshRemoteCopy::directoryExists(const std::string& remoteDir) {
    const auto result = runRemote("test -d " + shellQuote(remoteDir), std::nullopt);
    if (!result.timedOut && result.exitCode == 1) return false;
    if (auto err = classify(result, fmt::format("stat {}", remoteDir), target_.host)) throw *err;
    return true;
}

void SshRemoteCopy::rename(const std::string& from, const std::string& to) {
    runOrThrow("mv -f -- " + shellQuote(from) + " " + shellQuote(to), fmt::format("rename {} to {}", from, to));
}

void SshRemoteCopy::remove(const std::string& remotePath) {
    runOrThrow("rm -f -- " + shellQuote(remotePath), fmt::format("remove {}", remotePath));
}
