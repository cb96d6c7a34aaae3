#include "pipeline/model/FileStatus.hpp"

std::string lc::pipeline::model::to_string(const FileState state) {
    switch (state) {
        case FileState::Pending: return "pending";
        case FileState::Filtering: return "filtering";
        case FileState::Resolving: return "resolving";
        case FileState::Transferring: return "transferring";
        case FileState::Archiving: return "archiving";
        case FileState::Done: return "done";
        case FileState::Failed: return "failed";
    }
    return "unknown";
}
