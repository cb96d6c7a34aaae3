#pragma once

#include "concurrency/AsyncService.hpp"
#include "pipeline/model/WatchEvent.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>

struct inotify_event;

namespace lc::pipeline {

// Watches one directory (non-recursive) with inotify and hands every event to
// the sink. The sink may block; that blocks the watcher thread and nothing is
// dropped. A sink returning false means the consumer has shut down.
class Watcher final : public concurrency::AsyncService {
public:
    using Sink = std::function<bool(model::WatchEvent)>;

    Watcher(std::filesystem::path sourceDir, bool touchExisting, Sink sink);

    ~Watcher() override;

    // Establishes the watch before the thread starts so no event after start()
    // returns is missed. Throws std::runtime_error when the watch cannot be set.
    void start() override;

    [[nodiscard]] const std::filesystem::path& sourceDir() const { return sourceDir_; }

protected:
    void runLoop() override;

private:
    struct PendingMove {
        std::string name;
        bool stillOpen;     // renamed before its writer closed it
        std::chrono::steady_clock::time_point seen;
    };

    std::filesystem::path sourceDir_;
    bool touchExisting_;
    Sink sink_;

    int inotifyFd_{-1};
    int watchFd_{-1};

    std::unordered_set<std::string> openCreated_;
    std::unordered_map<uint32_t, PendingMove> pendingMoves_;

    void openWatch();
    void closeWatch();
    bool rewatch();

    void announceExisting();
    void drainEvents();
    void handle(const inotify_event& ev);
    void flushPendingMoves(bool all);

    void emit(model::WatchEvent event);
};

}
