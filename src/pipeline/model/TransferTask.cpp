#include "pipeline/model/TransferTask.hpp"

using namespace lc::pipeline::model;

namespace {

std::string joinRemote(const std::string& base, const std::string& leaf) {
    if (base.empty()) return leaf;
    if (leaf.empty()) return base;
    if (base.back() == '/') return base + leaf;
    return base + "/" + leaf;
}

}

std::string TransferTask::remoteDirectory() const {
    return joinRemote(remoteBasePath, remoteSubfolder);
}

std::string TransferTask::remotePath() const {
    return joinRemote(remoteDirectory(), resultFile.filename);
}
