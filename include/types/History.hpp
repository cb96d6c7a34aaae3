#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace lc::types {

// One terminal delivery outcome, as written to the audit log or transfer_history
struct History {
    enum class Status { Sent, Failed };

    std::string hostname;           // this host
    std::string remote_hostname;
    std::string user;               // remote login
    std::string path;               // local source path
    std::string remote_path;        // remote base path
    std::string remote_folder;
    std::string hint;
    std::string archive_path;
    std::string filename;           // archived filename, original name when not archived
    uintmax_t size{0};
    std::time_t mtime{0};
    std::string mime_type;
    Status status{Status::Failed};
    std::optional<std::string> reason;
    std::string error;
    unsigned int attempts{0};
    std::time_t sent_at{std::time(nullptr)};
};

std::string to_string(History::Status status);

}
