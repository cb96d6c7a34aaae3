#pragma once

#include "pipeline/errors.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace lc::pipeline::model {

enum class FileState {
    Pending,
    Filtering,
    Resolving,
    Transferring,
    Archiving,
    Done,
    Failed
};

std::string to_string(FileState state);

// Snapshot of one tracked local path
struct FileStatus {
    FileState state{FileState::Pending};
    std::optional<FailureReason> reason;    // set iff state == Failed
    bool filtered{false};                   // Done without transfer: did not match
    unsigned int attempts{0};               // transfer attempts of the latest run
    std::optional<std::string> lastError;
    std::string remotePath;
    std::filesystem::path archivedPath;
    std::chrono::system_clock::time_point updatedAt{std::chrono::system_clock::now()};

    [[nodiscard]] bool delivered() const { return state == FileState::Done && !filtered; }
};

}
