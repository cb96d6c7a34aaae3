#pragma once

#include "pipeline/model/ResultFile.hpp"

#include <optional>
#include <string>

namespace lc::pipeline::model {

struct TransferTask {
    ResultFile resultFile;
    std::string remoteBasePath;
    std::string remoteSubfolder;
    unsigned int attemptCount{0};
    std::optional<std::string> lastError;

    [[nodiscard]] std::string remoteDirectory() const;
    [[nodiscard]] std::string remotePath() const;
};

}
