#pragma once

#include "pipeline/model/TransferTask.hpp"

#include <memory>
#include <string>

namespace lc::remote { class RemoteCopy; }

namespace lc::pipeline {

class Transferer {
public:
    virtual ~Transferer() = default;

    // Delivers task.resultFile to task.remotePath() and returns that path.
    // Throws TransferError (AuthFailure, NetworkFailure, RemoteIOFailure).
    virtual std::string transfer(const model::TransferTask& task, bool mkdirRemote) = 0;
};

// Writes to a hidden temporary name in the destination folder and renames it
// into place, so the remote side never sees a partial file under its final name.
class RemoteTransferer final : public Transferer {
public:
    explicit RemoteTransferer(std::shared_ptr<remote::RemoteCopy> remote);

    std::string transfer(const model::TransferTask& task, bool mkdirRemote) override;

    [[nodiscard]] static std::string temporaryName(const std::string& filename);

private:
    std::shared_ptr<remote::RemoteCopy> remote_;

    void discard(const std::string& tmpPath) const;
};

}
