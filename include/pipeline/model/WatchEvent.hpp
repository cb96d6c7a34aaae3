#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace lc::pipeline::model {

struct WatchEvent {
    enum class Kind { Created, Modified, Moved, Deleted };

    Kind kind{Kind::Created};
    std::filesystem::path path;
    std::filesystem::path fromPath;     // Moved only: previous name inside the watched directory
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    WatchEvent() = default;
    WatchEvent(const Kind k, std::filesystem::path p) : kind(k), path(std::move(p)) {}

    static WatchEvent moved(std::filesystem::path from, std::filesystem::path to) {
        WatchEvent e(Kind::Moved, std::move(to));
        e.fromPath = std::move(from);
        return e;
    }

    [[nodiscard]] std::string kindToString() const;
};

}
