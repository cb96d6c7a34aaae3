#pragma once

#include "remote/RemoteCopy.hpp"
#include "pipeline/errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lc::util { struct ProcessResult; }

namespace lc::remote {

struct SshTarget {
    std::string host;
    std::string user;
    uint16_t port = 22;
    std::string identityFile;
    std::chrono::milliseconds connectTimeout = std::chrono::seconds(5);
};

// RemoteCopy over the system `ssh` client in batch mode. Key-based auth only.
class SshRemoteCopy final : public RemoteCopy {
public:
    SshRemoteCopy(SshTarget target, std::chrono::milliseconds commandTimeout);

    void copy(const std::filesystem::path& localPath, const std::string& remotePath) override;
    void makeDirectories(const std::string& remoteDir) override;
    [[nodiscard]] bool directoryExists(const std::string& remoteDir) override;
    void rename(const std::string& from, const std::string& to) override;
    void remove(const std::string& remotePath) override;

    // Full argv for running remoteCommand on the target
    [[nodiscard]] std::vector<std::string> buildCommand(const std::string& remoteCommand) const;

    // nullopt when the result is a success
    [[nodiscard]] static std::optional<pipeline::TransferError>
    classify(const util::ProcessResult& result, const std::string& action, const std::string& host);

    [[nodiscard]] const SshTarget& target() const { return target_; }

private:
    SshTarget target_;
    std::chrono::milliseconds commandTimeout_;

    util::ProcessResult runRemote(const std::string& remoteCommand,
                                  const std::optional<std::filesystem::path>& stdinPath) const;

    void runOrThrow(const std::string& remoteCommand, const std::string& action,
                    const std::optional<std::filesystem::path>& stdinPath = std::nullopt) const;
};

}
