#pragma once

#include <filesystem>
#include <string>

namespace lc::remote {

// Primitive operations on the destination host. Remote paths are absolute
// POSIX paths. Every failure is thrown as pipeline::TransferError.
class RemoteCopy {
public:
    virtual ~RemoteCopy() = default;

    virtual void copy(const std::filesystem::path& localPath, const std::string& remotePath) = 0;

    virtual void makeDirectories(const std::string& remoteDir) = 0;

    [[nodiscard]] virtual bool directoryExists(const std::string& remoteDir) = 0;

    // Replaces `to` when it exists
    virtual void rename(const std::string& from, const std::string& to) = 0;

    virtual void remove(const std::string& remotePath) = 0;
};

}
