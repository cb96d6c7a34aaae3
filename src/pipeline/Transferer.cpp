#include "pipeline/Transferer.hpp"
#include "pipeline/errors.hpp"
#include "remote/RemoteCopy.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace lc::pipeline;
using namespace lc::pipeline::model;
using namespace lc::log;

RemoteTransferer::RemoteTransferer(std::shared_ptr<remote::RemoteCopy> remote)
    : remote_(std::move(remote)) {
    if (!remote_) throw std::invalid_argument("RemoteTransferer requires a remote copy backend");
}

std::string RemoteTransferer::temporaryName(const std::string& filename) {
    return "." + filename + ".part";
}

std::string RemoteTransferer::transfer(const TransferTask& task, const bool mkdirRemote) {
    const auto& file = task.resultFile;
    const auto dir = task.remoteDirectory();
    const auto finalPath = task.remotePath();
    const auto tmpPath = dir + "/" + temporaryName(file.filename);

    if (!remote_->directoryExists(dir)) {
        if (!mkdirRemote)
            throw TransferError::remoteIO(fmt::format("remote folder {} does not exist and mkdir_remote is off", dir), false);
        Registry::transfer()->info("[Transferer] Creating remote folder {}", dir);
        remote_->makeDirectories(dir);
    }

    try {
        remote_->copy(file.localPath, tmpPath);
    } catch (const TransferError&) {
        discard(tmpPath);
        throw;
    }

    try {
        remote_->rename(tmpPath, finalPath);
    } catch (const TransferError& e) {
        Registry::transfer()->warn("[Transferer] Rename {} -> {} failed: {}", tmpPath, finalPath, e.what());
        discard(tmpPath);
        throw;
    }

    Registry::transfer()->debug("[Transferer] {} -> {}", file.localPath.string(), finalPath);
    return finalPath;
}

void RemoteTransferer::discard(const std::string& tmpPath) const {
    try {
        remote_->remove(tmpPath);
    } catch (const TransferError& e) {
        Registry::transfer()->warn("[Transferer] Could not remove temporary file {}: {}", tmpPath, e.what());
    }
}
